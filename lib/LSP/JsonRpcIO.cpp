//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements `Content-Length` framed JSON-RPC stream transport.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/JsonRpcIO.h"

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace lspbridge::lsp
{
namespace
{

constexpr std::size_t MaxPayloadBytes = 256U * 1024U * 1024U;

/// Returns `std::nullopt` when `line` is not a `Content-Length` header and
/// `0` when it is one with an unusable value.
std::optional<std::size_t> parseContentLengthHeader(llvm::StringRef line)
{
    const auto [name, rawValue] = line.split(':');
    if (!name.trim().equals_insensitive("Content-Length"))
    {
        return std::nullopt;
    }
    std::size_t value = 0;
    if (rawValue.trim().getAsInteger(10, value))
    {
        return std::size_t{0};
    }
    return value;
}

}  // namespace

JsonRpcStdioTransport::JsonRpcStdioTransport(std::istream& in, std::ostream& out)
    : input_(in)
    , output_(out)
{
}

ReadStatus JsonRpcStdioTransport::readMessage(llvm::json::Value& message, std::string& error)
{
    std::size_t contentLength = 0U;
    bool        hasHeaders    = false;
    bool        terminated    = false;
    std::string line;
    while (std::getline(input_, line))
    {
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        if (line.empty())
        {
            // Blank lines between frames are tolerated.
            if (!hasHeaders)
            {
                continue;
            }
            terminated = true;
            break;
        }

        hasHeaders = true;
        if (const auto parsedLength = parseContentLengthHeader(line))
        {
            contentLength = *parsedLength;
        }
    }

    if (!terminated)
    {
        if (hasHeaders)
        {
            error = "truncated JSON-RPC header";
        }
        return ReadStatus::EndOfStream;
    }

    if (contentLength == 0U)
    {
        error = "missing Content-Length header";
        return ReadStatus::MalformedFrame;
    }
    if (contentLength > MaxPayloadBytes)
    {
        error = "Content-Length exceeds payload limit";
        return ReadStatus::EndOfStream;
    }

    std::string payload(contentLength, '\0');
    input_.read(payload.data(), static_cast<std::streamsize>(contentLength));
    if (input_.gcount() != static_cast<std::streamsize>(contentLength))
    {
        error = "truncated JSON-RPC payload";
        return ReadStatus::EndOfStream;
    }

    llvm::Expected<llvm::json::Value> parsed = llvm::json::parse(payload);
    if (!parsed)
    {
        error = "invalid JSON payload: " + llvm::toString(parsed.takeError());
        return ReadStatus::MalformedFrame;
    }

    message = std::move(*parsed);
    return ReadStatus::Message;
}

bool JsonRpcStdioTransport::writeMessage(const llvm::json::Value& message)
{
    std::string              payload;
    llvm::raw_string_ostream payloadStream(payload);
    payloadStream << message;
    payloadStream.flush();

    std::lock_guard<std::mutex> lock(writeMutex_);
    if (outputClosed_ || !output_)
    {
        return false;
    }
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    output_.flush();
    return static_cast<bool>(output_);
}

void JsonRpcStdioTransport::closeOutput(const std::function<void()>& closer)
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    if (outputClosed_)
    {
        return;
    }
    outputClosed_ = true;
    if (closer)
    {
        closer();
    }
}

bool JsonRpcStdioTransport::isOutputClosed() const
{
    std::lock_guard<std::mutex> lock(writeMutex_);
    return outputClosed_;
}

}  // namespace lspbridge::lsp
