//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements leveled log routing and the default stderr sink.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Logger.h"

#include "llvm/Support/raw_ostream.h"

#include <memory>
#include <utility>

namespace lspbridge::lsp
{

Logger::Logger()
    : sink_(stderrSink())
{
}

Logger::Logger(LogSink sink, const TraceLevel level)
    : level_(level)
    , sink_(std::move(sink))
{
}

void Logger::setSink(LogSink sink)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::setLevel(const TraceLevel level)
{
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::enabled(const TraceLevel level) const
{
    const TraceLevel current = level_.load(std::memory_order_relaxed);
    return level != TraceLevel::Off && current != TraceLevel::Off &&
           static_cast<int>(level) <= static_cast<int>(current);
}

void Logger::log(const TraceLevel level, const llvm::StringRef component, const llvm::StringRef message)
{
    if (!enabled(level))
    {
        return;
    }
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    if (sink)
    {
        sink(LogRecord{level, component.str(), message.str()});
    }
}

LogSink Logger::stderrSink()
{
    auto writeMutex = std::make_shared<std::mutex>();
    return [writeMutex](const LogRecord& record) {
        std::lock_guard<std::mutex> lock(*writeMutex);
        llvm::errs() << "[lspbridge][" << record.component << "] " << record.message << "\n";
    };
}

bool parseTraceLevel(const llvm::StringRef text, TraceLevel& level)
{
    if (text.equals_insensitive("off"))
    {
        level = TraceLevel::Off;
        return true;
    }
    if (text.equals_insensitive("basic") || text.equals_insensitive("messages"))
    {
        level = TraceLevel::Basic;
        return true;
    }
    if (text.equals_insensitive("verbose"))
    {
        level = TraceLevel::Verbose;
        return true;
    }
    return false;
}

}  // namespace lspbridge::lsp
