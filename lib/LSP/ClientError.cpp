//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the client error payload and helpers.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/ClientError.h"

#include "llvm/Support/raw_ostream.h"

#include <utility>

namespace lspbridge::lsp
{

char ClientError::ID = 0;

llvm::StringRef errorKindName(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::TransportFault:
        return "transport-fault";
    case ErrorKind::SessionClosed:
        return "session-closed";
    case ErrorKind::ProtocolError:
        return "protocol-error";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::NotReady:
        return "not-ready";
    case ErrorKind::SyncError:
        return "sync-error";
    case ErrorKind::InvalidResponse:
        return "invalid-response";
    case ErrorKind::InvalidArgument:
        return "invalid-argument";
    case ErrorKind::SpawnFailed:
        return "spawn-failed";
    }
    return "unknown";
}

ClientError::ClientError(const ErrorKind kind, std::string message, const std::int64_t code)
    : kind_(kind)
    , message_(std::move(message))
    , code_(code)
{
}

void ClientError::log(llvm::raw_ostream& os) const
{
    os << errorKindName(kind_) << ": " << message_;
    if (kind_ == ErrorKind::ProtocolError)
    {
        os << " (code " << code_ << ")";
    }
}

std::error_code ClientError::convertToErrorCode() const
{
    switch (kind_)
    {
    case ErrorKind::TransportFault:
    case ErrorKind::SessionClosed:
        return std::make_error_code(std::errc::broken_pipe);
    case ErrorKind::Timeout:
        return std::make_error_code(std::errc::timed_out);
    case ErrorKind::Cancelled:
        return std::make_error_code(std::errc::operation_canceled);
    case ErrorKind::InvalidArgument:
        return std::make_error_code(std::errc::invalid_argument);
    default:
        return llvm::inconvertibleErrorCode();
    }
}

llvm::Error makeClientError(const ErrorKind kind, std::string message, const std::int64_t code)
{
    return llvm::make_error<ClientError>(kind, std::move(message), code);
}

std::optional<ErrorKind> consumeErrorKind(llvm::Error error)
{
    std::optional<ErrorKind> kind;
    llvm::handleAllErrors(
        std::move(error),
        [&kind](const ClientError& clientError) {
            if (!kind)
            {
                kind = clientError.kind();
            }
        },
        [](const llvm::ErrorInfoBase&) {});
    return kind;
}

}  // namespace lspbridge::lsp
