//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Leveled log routing for the client runtime.
///
/// Records are filtered by trace level and forwarded to a sink callback. The
/// default sink writes prefixed lines to `llvm::errs()`. Server stderr output
/// and `window/logMessage` traffic are routed here as side-channel logs.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_LOGGER_H
#define LSPBRIDGE_LSP_LOGGER_H

#include "llvm/ADT/StringRef.h"

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace lspbridge::lsp
{

/// @brief Trace verbosity level for client logs.
enum class TraceLevel
{
    /// @brief Disable log output.
    Off,

    /// @brief Emit lifecycle events, server stderr and server log messages.
    Basic,

    /// @brief Emit per-message traces for debugging.
    Verbose,
};

/// @brief One routed log line.
struct LogRecord final
{
    /// @brief Level the record was emitted at.
    TraceLevel level{TraceLevel::Basic};

    /// @brief Emitting component, e.g. `transport` or `server-stderr`.
    std::string component;

    /// @brief Log message text.
    std::string message;
};

/// @brief Sink callback receiving filtered log records.
using LogSink = std::function<void(const LogRecord&)>;

/// @brief Thread-safe leveled logger with a replaceable sink.
class Logger final
{
public:
    /// @brief Creates a logger writing to `llvm::errs()` at `Basic` level.
    Logger();

    /// @brief Creates a logger with an explicit sink and level.
    /// @param[in] sink Sink callback. Empty sink discards records.
    /// @param[in] level Maximum level forwarded to the sink.
    explicit Logger(LogSink sink, TraceLevel level = TraceLevel::Basic);

    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    /// @brief Replaces the sink callback.
    /// @param[in] sink Sink callback. Empty sink discards records.
    void setSink(LogSink sink);

    /// @brief Sets the maximum forwarded level.
    /// @param[in] level New level.
    void setLevel(TraceLevel level);

    [[nodiscard]] TraceLevel level() const
    {
        return level_.load(std::memory_order_relaxed);
    }

    /// @brief Returns whether records at `level` reach the sink.
    /// @param[in] level Candidate level.
    /// @return `true` when enabled.
    [[nodiscard]] bool enabled(TraceLevel level) const;

    /// @brief Emits one record.
    /// @param[in] level Record level.
    /// @param[in] component Emitting component name.
    /// @param[in] message Message text.
    void log(TraceLevel level, llvm::StringRef component, llvm::StringRef message);

    void basic(llvm::StringRef component, llvm::StringRef message)
    {
        log(TraceLevel::Basic, component, message);
    }

    void verbose(llvm::StringRef component, llvm::StringRef message)
    {
        log(TraceLevel::Verbose, component, message);
    }

    /// @brief Returns the default sink writing `[lspbridge][component] message` lines to stderr.
    /// @return Sink callback.
    [[nodiscard]] static LogSink stderrSink();

private:
    std::atomic<TraceLevel> level_{TraceLevel::Basic};
    mutable std::mutex      mutex_;
    LogSink                 sink_;
};

/// @brief Parses a trace level name (`off`, `basic`, `verbose`).
/// @param[in] text Level name, case-insensitive.
/// @param[out] level Parsed level.
/// @return `true` when `text` names a level.
[[nodiscard]] bool parseTraceLevel(llvm::StringRef text, TraceLevel& level);

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_LOGGER_H
