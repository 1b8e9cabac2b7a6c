//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Ordered delivery of server notifications and server-initiated requests.
///
/// The receive loop enqueues inbound messages; one consumer thread runs the
/// registered handlers in arrival order. Server-initiated requests are
/// answered from the consumer thread; requests without a handler receive a
/// `MethodNotFound` error reply so the server never blocks on the client.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_NOTIFICATION_DISPATCHER_H
#define LSPBRIDGE_LSP_NOTIFICATION_DISPATCHER_H

#include "lspbridge/LSP/Logger.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lspbridge::lsp
{

/// @brief Handler for one notification method.
using NotificationHandler = std::function<void(const llvm::json::Value& params)>;

/// @brief Handler for one server-initiated request method; the value becomes the reply `result`.
using ServerRequestHandler = std::function<llvm::Expected<llvm::json::Value>(const llvm::json::Value& params)>;

/// @brief Handler for recoverable decoding failures.
using FrameErrorHandler = std::function<void(const std::string& error)>;

/// @brief Writes a reply to the server.
using ReplySender = std::function<llvm::Error(llvm::json::Value reply)>;

/// @brief Single-consumer dispatcher for inbound non-response messages.
class NotificationDispatcher final
{
public:
    /// @brief Creates a dispatcher and starts its consumer thread.
    /// @param[in] logger Log router.
    explicit NotificationDispatcher(Logger& logger);
    ~NotificationDispatcher();

    NotificationDispatcher(const NotificationDispatcher&)            = delete;
    NotificationDispatcher& operator=(const NotificationDispatcher&) = delete;

    /// @brief Registers or replaces the handler for a notification method.
    void onNotification(std::string method, NotificationHandler handler);

    /// @brief Registers or replaces the handler for a server-initiated request method.
    void onRequest(std::string method, ServerRequestHandler handler);

    /// @brief Registers the frame error handler.
    void onFrameError(FrameErrorHandler handler);

    /// @brief Installs the reply path used for server-initiated requests.
    void setReplySender(ReplySender sender);

    /// @brief Queues a notification or request for dispatch.
    /// @param[in] message Decoded JSON-RPC message.
    /// @return `false` after shutdown.
    bool enqueue(llvm::json::Value message);

    /// @brief Queues a frame error report behind previously queued messages.
    /// @param[in] error Decoder error text.
    void reportFrameError(std::string error);

    /// @brief Blocks until every queued item has been handled.
    void drain();

    /// @brief Stops the consumer thread. Queued items are discarded.
    void shutdown();

    /// @brief Returns the number of messages handled so far.
    [[nodiscard]] std::uint64_t dispatchedCount() const;

    /// @brief Returns the number of frame errors reported so far.
    [[nodiscard]] std::uint64_t frameErrorCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_NOTIFICATION_DISPATCHER_H
