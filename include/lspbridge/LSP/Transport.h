//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Duplex message transport with a background receive loop.
///
/// The receive loop decodes one frame at a time and only classifies and
/// forwards: responses go to the response handler, notifications and
/// server-initiated requests go to the inbound handler. Malformed frames are
/// reported and skipped. End of stream ends the loop and is reported once
/// through the closed handler. All writes share one serialized send path.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_TRANSPORT_H
#define LSPBRIDGE_LSP_TRANSPORT_H

#include "lspbridge/LSP/JsonRpcIO.h"
#include "lspbridge/LSP/Logger.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <string>
#include <thread>

namespace lspbridge::lsp
{

/// @brief JSON-RPC transport bound to one input/output stream pair.
class Transport final
{
public:
    /// @brief Callbacks invoked from the receive loop.
    struct Handlers final
    {
        /// @brief Receives every decoded response.
        std::function<void(llvm::json::Value response)> onResponse;

        /// @brief Receives notifications and server-initiated requests in arrival order.
        std::function<void(llvm::json::Value message)> onInbound;

        /// @brief Receives recoverable frame errors.
        std::function<void(std::string error)> onFrameError;

        /// @brief Invoked once when the stream closes or a write fails.
        std::function<void(std::string reason)> onClosed;
    };

    /// @brief Creates a transport over the given streams.
    /// @param[in] in Stream carrying server output.
    /// @param[in] out Stream feeding server input.
    /// @param[in] logger Log router for trace output.
    Transport(std::istream& in, std::ostream& out, Logger& logger);

    /// @brief Joins the receive thread. The input stream must reach end of stream first.
    ~Transport();

    Transport(const Transport&)            = delete;
    Transport& operator=(const Transport&) = delete;

    /// @brief Installs receive-loop callbacks. Call before `start()` or `receiveLoop()`.
    /// @param[in] handlers Callbacks.
    void setHandlers(Handlers handlers);

    /// @brief Runs `receiveLoop()` on a dedicated thread.
    void start();

    /// @brief Reads and dispatches frames until end of stream.
    void receiveLoop();

    /// @brief Sends one message through the serialized send path.
    /// @param[in] message JSON-RPC message.
    /// @return `TransportFault` when the transport is closed or the write fails.
    [[nodiscard]] llvm::Error send(const llvm::json::Value& message);

    /// @brief Stops all writes and runs `closer` to release the server input.
    /// @param[in] closer Callback, typically closing the server's stdin.
    void closeOutput(const std::function<void()>& closer);

    /// @brief Waits for the receive thread to finish.
    void join();

    /// @brief Returns whether the transport has closed.
    [[nodiscard]] bool isClosed() const
    {
        return closed_.load(std::memory_order_acquire);
    }

    /// @brief Returns the number of frames decoded successfully.
    [[nodiscard]] std::uint64_t framesReceived() const
    {
        return framesReceived_.load(std::memory_order_relaxed);
    }

    /// @brief Returns the number of malformed frames skipped.
    [[nodiscard]] std::uint64_t malformedFrames() const
    {
        return malformedFrames_.load(std::memory_order_relaxed);
    }

private:
    void markClosed(std::string reason);

    JsonRpcStdioTransport      framing_;
    Logger&                    logger_;
    Handlers                   handlers_;
    std::thread                receiver_;
    std::mutex                 joinMutex_;
    std::atomic_bool           closed_{false};
    std::atomic<std::uint64_t> framesReceived_{0};
    std::atomic<std::uint64_t> malformedFrames_{0};
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_TRANSPORT_H
