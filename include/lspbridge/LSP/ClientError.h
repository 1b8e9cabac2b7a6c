//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Error taxonomy for the language-server client runtime.
///
/// Every fallible client operation reports failures as `llvm::Error` values
/// carrying a `ClientError` payload. The payload kind lets callers tell a
/// session-fatal transport fault apart from a per-request protocol error or
/// timeout without parsing message text.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_CLIENT_ERROR_H
#define LSPBRIDGE_LSP_CLIENT_ERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

namespace lspbridge::lsp
{

/// @brief Failure category reported by client operations.
enum class ErrorKind
{
    /// @brief The byte stream to the server is closed or a write failed.
    TransportFault,

    /// @brief The session ended while the call was pending or before it was issued.
    SessionClosed,

    /// @brief The server answered with a JSON-RPC error response.
    ProtocolError,

    /// @brief No response arrived before the call deadline.
    Timeout,

    /// @brief The caller cancelled the call before a response arrived.
    Cancelled,

    /// @brief The operation was attempted before the handshake completed.
    NotReady,

    /// @brief A document open/change/close notification could not be sent.
    SyncError,

    /// @brief The server result did not match any accepted shape.
    InvalidResponse,

    /// @brief Caller input was rejected before any I/O.
    InvalidArgument,

    /// @brief The server subprocess could not be started.
    SpawnFailed,
};

/// @brief Returns a stable lowercase name for an error kind.
/// @param[in] kind Error kind.
/// @return Kind name such as `timeout`.
[[nodiscard]] llvm::StringRef errorKindName(ErrorKind kind);

/// @brief `llvm::Error` payload describing one client failure.
class ClientError final : public llvm::ErrorInfo<ClientError>
{
public:
    static char ID;

    /// @brief Creates an error payload.
    /// @param[in] kind Failure category.
    /// @param[in] message Human-readable description.
    /// @param[in] code JSON-RPC error code for protocol errors, otherwise `0`.
    ClientError(ErrorKind kind, std::string message, std::int64_t code = 0);

    void            log(llvm::raw_ostream& os) const override;
    std::error_code convertToErrorCode() const override;

    [[nodiscard]] ErrorKind kind() const
    {
        return kind_;
    }

    [[nodiscard]] std::string message() const override
    {
        return message_;
    }

    [[nodiscard]] std::int64_t code() const
    {
        return code_;
    }

private:
    ErrorKind    kind_;
    std::string  message_;
    std::int64_t code_;
};

/// @brief Builds an `llvm::Error` holding a `ClientError`.
/// @param[in] kind Failure category.
/// @param[in] message Human-readable description.
/// @param[in] code Optional JSON-RPC error code.
/// @return Failure value.
[[nodiscard]] llvm::Error makeClientError(ErrorKind kind, std::string message, std::int64_t code = 0);

/// @brief Consumes an error and returns its client error kind.
/// @param[in] error Error to inspect. Consumed in all cases.
/// @return Kind of the first `ClientError` payload, `std::nullopt` for success
///         or foreign error types.
[[nodiscard]] std::optional<ErrorKind> consumeErrorKind(llvm::Error error);

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_CLIENT_ERROR_H
