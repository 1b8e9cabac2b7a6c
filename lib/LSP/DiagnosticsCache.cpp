//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the diagnostics cache.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/DiagnosticsCache.h"

#include <algorithm>
#include <utility>

namespace lspbridge::lsp
{

std::uint64_t DiagnosticsCache::nextSequence()
{
    return sequence_.fetch_add(1, std::memory_order_relaxed) + 1U;
}

bool DiagnosticsCache::isOlder(const DiagnosticStamp& candidate, const DiagnosticStamp& stored)
{
    if (candidate.documentVersion && stored.documentVersion &&
        *candidate.documentVersion != *stored.documentVersion)
    {
        return *candidate.documentVersion < *stored.documentVersion;
    }
    return candidate.sequence < stored.sequence;
}

bool DiagnosticsCache::update(std::string uri, std::vector<DiagnosticEntry> diagnostics, DiagnosticStamp stamp)
{
    auto set         = std::make_shared<DiagnosticSet>();
    set->uri         = uri;
    set->diagnostics = std::move(diagnostics);
    set->stamp       = stamp;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto&                       slot = sets_[std::move(uri)];
        if (slot && isOlder(stamp, slot->stamp))
        {
            return false;
        }
        slot = std::move(set);
    }
    cv_.notify_all();
    return true;
}

DiagnosticSet DiagnosticsCache::snapshot(const std::string& uri) const
{
    if (auto stored = lookup(uri))
    {
        return std::move(*stored);
    }
    DiagnosticSet empty;
    empty.uri = uri;
    return empty;
}

std::optional<DiagnosticSet> DiagnosticsCache::lookup(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = sets_.find(uri);
    if (it == sets_.end() || !it->second)
    {
        return std::nullopt;
    }
    return *it->second;
}

bool DiagnosticsCache::waitForUpdate(const std::string&              uri,
                                     const std::uint64_t             afterSequence,
                                     const std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() {
        const auto it = sets_.find(uri);
        return it != sets_.end() && it->second && it->second->stamp.sequence > afterSequence;
    });
}

std::uint64_t DiagnosticsCache::currentSequence(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto                  it = sets_.find(uri);
    return it == sets_.end() || !it->second ? 0U : it->second->stamp.sequence;
}

std::vector<std::string> DiagnosticsCache::uris() const
{
    std::vector<std::string> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(sets_.size());
        for (const auto& [uri, _] : sets_)
        {
            result.push_back(uri);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void DiagnosticsCache::erase(const std::string& uri)
{
    std::lock_guard<std::mutex> lock(mutex_);
    sets_.erase(uri);
}

void DiagnosticsCache::clear()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sets_.clear();
    }
    cv_.notify_all();
}

}  // namespace lspbridge::lsp
