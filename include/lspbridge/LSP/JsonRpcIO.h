//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Stdio JSON-RPC framing utilities for Language Server Protocol transport.
///
/// Messages are encoded with `Content-Length` framing and decoded into LLVM
/// JSON values. Read failures are split into recoverable frame errors, after
/// which the stream is positioned at the next frame boundary, and end of
/// stream.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_JSON_RPC_IO_H
#define LSPBRIDGE_LSP_JSON_RPC_IO_H

#include "llvm/Support/JSON.h"

#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>

namespace lspbridge::lsp
{

/// @brief Outcome of reading one frame.
enum class ReadStatus
{
    /// @brief A complete JSON payload was read.
    Message,

    /// @brief The frame was malformed; reading may continue with the next frame.
    MalformedFrame,

    /// @brief The stream ended or faulted; no further frames can be read.
    EndOfStream,
};

/// @brief JSON-RPC stream transport with `Content-Length` framing.
class JsonRpcStdioTransport final
{
public:
    /// @brief Creates a transport over input and output streams.
    /// @param[in] in Input stream.
    /// @param[in] out Output stream.
    JsonRpcStdioTransport(std::istream& in, std::ostream& out);

    /// @brief Reads one framed JSON-RPC message.
    /// @param[out] message Parsed JSON payload.
    /// @param[out] error Framing/parsing error text when the read fails.
    /// @return Read outcome.
    [[nodiscard]] ReadStatus readMessage(llvm::json::Value& message, std::string& error);

    /// @brief Writes one framed JSON-RPC message.
    /// @param[in] message JSON payload to write.
    /// @return `true` when write succeeds.
    [[nodiscard]] bool writeMessage(const llvm::json::Value& message);

    /// @brief Runs `closer` while no write is in progress and refuses later writes.
    /// @param[in] closer Callback that releases the underlying output.
    void closeOutput(const std::function<void()>& closer);

    /// @brief Returns whether `closeOutput()` has run.
    [[nodiscard]] bool isOutputClosed() const;

private:
    std::istream&      input_;
    std::ostream&      output_;
    mutable std::mutex writeMutex_;
    bool               outputClosed_{false};
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_JSON_RPC_IO_H
