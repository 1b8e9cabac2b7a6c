//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements request telemetry recording.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Telemetry.h"

#include <utility>

namespace lspbridge::lsp
{

llvm::StringRef requestOutcomeName(const RequestOutcome outcome)
{
    switch (outcome)
    {
    case RequestOutcome::Completed:
        return "completed";
    case RequestOutcome::Failed:
        return "failed";
    case RequestOutcome::TimedOut:
        return "timed-out";
    case RequestOutcome::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

RequestOutcome requestOutcomeFor(const ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Timeout:
        return RequestOutcome::TimedOut;
    case ErrorKind::Cancelled:
        return RequestOutcome::Cancelled;
    default:
        return RequestOutcome::Failed;
    }
}

void Telemetry::setSink(RequestMetricSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Telemetry::record(std::string method, const std::uint64_t latencyMicros, const RequestOutcome outcome)
{
    RequestMetricSink sink;
    RequestMetric     metric{method, latencyMicros, outcome};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++requestCounts_[method];
        ++outcomeCounts_[static_cast<std::size_t>(outcome)];
        sink = sink_;
    }
    if (sink)
    {
        sink(metric);
    }
}

std::uint64_t Telemetry::requestCount(const std::string_view method) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = requestCounts_.find(std::string(method));
    return it == requestCounts_.end() ? 0U : it->second;
}

std::uint64_t Telemetry::outcomeCount(const RequestOutcome outcome) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomeCounts_[static_cast<std::size_t>(outcome)];
}

}  // namespace lspbridge::lsp
