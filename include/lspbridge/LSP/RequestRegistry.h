//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Correlation of outgoing requests with their responses.
///
/// Every outgoing request registers a pending-call slot keyed by its integer
/// identifier. The slot is fulfilled exactly once: by the matching response,
/// by deadline expiry on the registry watchdog thread, by caller cancellation,
/// or by session closure. Identifiers that stopped waiting are remembered for
/// a retention window so late responses are recognised and dropped.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_REQUEST_REGISTRY_H
#define LSPBRIDGE_LSP_REQUEST_REGISTRY_H

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/Logger.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lspbridge::lsp
{

/// @brief Cooperative cancellation flag shared between a caller and an in-flight request.
class CancellationToken final
{
public:
    /// @brief Creates a fresh, unset token.
    CancellationToken();

    /// @brief Requests cancellation. Safe to call from any thread.
    void cancel() const;

    /// @brief Returns whether cancellation has been requested.
    /// @return `true` when cancellation is requested.
    [[nodiscard]] bool isCancellationRequested() const;

private:
    std::shared_ptr<std::atomic_bool> state_;
};

/// @brief Caller-side handle for one outstanding request.
class PendingCall final
{
public:
    PendingCall() = default;

    /// @brief Returns the request identifier.
    [[nodiscard]] std::int64_t id() const;

    /// @brief Returns the request method.
    [[nodiscard]] const std::string& method() const;

    /// @brief Returns whether the call has been fulfilled.
    [[nodiscard]] bool isReady() const;

    /// @brief Waits for fulfillment up to `timeout`.
    /// @param[in] timeout Maximum wait.
    /// @return `true` when the call is fulfilled.
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;

    /// @brief Blocks until fulfillment and returns the outcome.
    /// @return Response `result` or the failure that ended the call.
    [[nodiscard]] llvm::Expected<llvm::json::Value> wait() const;

    /// @brief Internal fulfillment slot.
    class Slot;

private:
    friend class RequestRegistry;
    explicit PendingCall(std::shared_ptr<Slot> slot);

    std::shared_ptr<Slot> slot_;
};

/// @brief Result of routing a response or failure to the registry.
enum class FulfillStatus
{
    /// @brief A waiting caller received the outcome.
    Delivered,

    /// @brief The identifier stopped waiting recently; the outcome was dropped.
    Late,

    /// @brief The identifier is not known to the registry.
    Unknown,
};

/// @brief Callback invoked on the watchdog thread after a call times out.
using TimeoutHandler = std::function<void(std::int64_t id, const std::string& method)>;

/// @brief Thread-safe table of pending calls with a deadline watchdog.
class RequestRegistry final
{
public:
    /// @brief Creates a registry and starts its watchdog thread.
    /// @param[in] logger Log router.
    /// @param[in] lateRetention How long expired identifiers are remembered.
    RequestRegistry(Logger& logger, std::chrono::milliseconds lateRetention);
    ~RequestRegistry();

    RequestRegistry(const RequestRegistry&)            = delete;
    RequestRegistry& operator=(const RequestRegistry&) = delete;

    /// @brief Registers a pending call before its request is written.
    /// @param[in] id Request identifier.
    /// @param[in] method Request method, for tracing.
    /// @param[in] deadline Absolute deadline; `std::nullopt` waits indefinitely.
    /// @return Handle, `SessionClosed` after `failAll`, or `InvalidArgument` for a duplicate id.
    [[nodiscard]] llvm::Expected<PendingCall> registerCall(
        std::int64_t                                         id,
        std::string                                          method,
        std::optional<std::chrono::steady_clock::time_point> deadline);

    /// @brief Fulfills a call with a result.
    /// @param[in] id Request identifier.
    /// @param[in] result Response result.
    /// @return Routing status.
    FulfillStatus fulfill(std::int64_t id, llvm::json::Value result);

    /// @brief Fulfills a call with a failure.
    /// @param[in] id Request identifier.
    /// @param[in] kind Failure kind.
    /// @param[in] message Failure description.
    /// @param[in] code JSON-RPC error code for protocol errors.
    /// @return Routing status.
    FulfillStatus fulfillError(std::int64_t id, ErrorKind kind, std::string message, std::int64_t code = 0);

    /// @brief Routes a decoded JSON-RPC response to its caller.
    /// @param[in] response Response message.
    /// @return Routing status; non-integer identifiers are `Unknown`.
    FulfillStatus routeResponse(const llvm::json::Value& response);

    /// @brief Ends a call early and remembers its identifier as late.
    /// @param[in] id Request identifier.
    /// @param[in] kind `Cancelled` or `Timeout`.
    /// @param[in] reason Failure description.
    /// @return `true` when a waiting call was ended.
    bool cancel(std::int64_t id, ErrorKind kind, std::string reason);

    /// @brief Fails every outstanding call with `SessionClosed` and rejects new registrations.
    /// @param[in] reason Failure description.
    /// @return Number of calls failed.
    std::size_t failAll(const std::string& reason);

    /// @brief Accepts registrations again after `failAll`.
    void reopen();

    /// @brief Returns the number of calls still waiting.
    [[nodiscard]] std::size_t outstanding() const;

    /// @brief Returns whether the registry rejects new registrations.
    [[nodiscard]] bool isClosed() const;

    /// @brief Installs the timeout callback.
    /// @param[in] handler Callback invoked after each deadline expiry.
    void setTimeoutHandler(TimeoutHandler handler);

    /// @brief Fails outstanding calls and stops the watchdog thread.
    void shutdown();

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_REQUEST_REGISTRY_H
