//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Request telemetry collection primitives for the language-server client.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_TELEMETRY_H
#define LSPBRIDGE_LSP_TELEMETRY_H

#include "lspbridge/LSP/ClientError.h"
#include "llvm/ADT/StringRef.h"

#include <array>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace lspbridge::lsp
{

/// @brief How an outgoing request ended.
enum class RequestOutcome
{
    /// @brief A result arrived.
    Completed,

    /// @brief The server answered with an error or the session failed.
    Failed,

    /// @brief The deadline expired first.
    TimedOut,

    /// @brief The caller cancelled the request.
    Cancelled,
};

/// @brief Returns the lowercase name of an outcome.
[[nodiscard]] llvm::StringRef requestOutcomeName(RequestOutcome outcome);

/// @brief Maps a failure kind to the outcome it represents.
[[nodiscard]] RequestOutcome requestOutcomeFor(ErrorKind kind);

/// @brief Immutable telemetry sample for a finished request.
struct RequestMetric final
{
    /// @brief LSP method name.
    std::string method;

    /// @brief Request latency in microseconds.
    std::uint64_t latencyMicros{0};

    /// @brief How the request ended.
    RequestOutcome outcome{RequestOutcome::Completed};
};

/// @brief Sink callback invoked for each telemetry sample.
using RequestMetricSink = std::function<void(const RequestMetric&)>;

/// @brief Thread-safe request telemetry recorder.
class Telemetry final
{
public:
    /// @brief Sets the sink callback for newly recorded metrics.
    /// @param[in] sink Sink callback. Empty sink disables forwarding.
    void setSink(RequestMetricSink sink);

    /// @brief Records one request metric sample.
    /// @param[in] method LSP method name.
    /// @param[in] latencyMicros Elapsed time in microseconds.
    /// @param[in] outcome How the request ended.
    void record(std::string method, std::uint64_t latencyMicros, RequestOutcome outcome);

    /// @brief Returns total recorded request count for the method.
    /// @param[in] method LSP method name.
    /// @return Number of samples recorded for `method`.
    [[nodiscard]] std::uint64_t requestCount(std::string_view method) const;

    /// @brief Returns the number of samples recorded with `outcome`.
    [[nodiscard]] std::uint64_t outcomeCount(RequestOutcome outcome) const;

private:
    mutable std::mutex                             mutex_;
    RequestMetricSink                              sink_;
    std::unordered_map<std::string, std::uint64_t> requestCounts_;
    std::array<std::uint64_t, 4>                   outcomeCounts_{};
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_TELEMETRY_H
