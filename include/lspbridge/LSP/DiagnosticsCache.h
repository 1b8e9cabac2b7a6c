//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Latest-wins store of published diagnostics per document.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_DIAGNOSTICS_CACHE_H
#define LSPBRIDGE_LSP_DIAGNOSTICS_CACHE_H

#include "lspbridge/LSP/Protocol.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lspbridge::lsp
{

/// @brief Thread-safe diagnostics cache keyed by document URI.
///
/// Updates carrying a stamp older than the stored one are ignored, so a
/// stale push can never replace a newer set.
class DiagnosticsCache final
{
public:
    /// @brief Allocates the next receipt sequence number.
    /// @return Strictly increasing sequence, starting at `1`.
    [[nodiscard]] std::uint64_t nextSequence();

    /// @brief Replaces the stored set for `uri` unless `stamp` is older.
    /// @param[in] uri Document URI.
    /// @param[in] diagnostics New diagnostics.
    /// @param[in] stamp Ordering stamp of the update.
    /// @return `true` when the stored set was replaced.
    bool update(std::string uri, std::vector<DiagnosticEntry> diagnostics, DiagnosticStamp stamp);

    /// @brief Returns a copy of the stored set, or an empty set for unknown URIs.
    [[nodiscard]] DiagnosticSet snapshot(const std::string& uri) const;

    /// @brief Returns the stored set when one exists.
    [[nodiscard]] std::optional<DiagnosticSet> lookup(const std::string& uri) const;

    /// @brief Waits until a set for `uri` exists with a sequence above `afterSequence`.
    /// @param[in] uri Document URI.
    /// @param[in] afterSequence Sequence the caller already observed; `0` accepts any set.
    /// @param[in] timeout Maximum wait.
    /// @return `true` when a qualifying set is available.
    [[nodiscard]] bool waitForUpdate(const std::string&        uri,
                                     std::uint64_t             afterSequence,
                                     std::chrono::milliseconds timeout) const;

    /// @brief Returns the sequence of the stored set, or `0` when none exists.
    [[nodiscard]] std::uint64_t currentSequence(const std::string& uri) const;

    /// @brief Returns every URI with stored diagnostics, sorted.
    [[nodiscard]] std::vector<std::string> uris() const;

    /// @brief Drops the stored set for one URI.
    void erase(const std::string& uri);

    /// @brief Drops every stored set.
    void clear();

    /// @brief Returns whether `candidate` is older than `stored`.
    ///
    /// Document versions decide when both stamps carry one; otherwise the
    /// receipt sequence decides.
    [[nodiscard]] static bool isOlder(const DiagnosticStamp& candidate, const DiagnosticStamp& stored);

private:
    mutable std::mutex                                                    mutex_;
    mutable std::condition_variable                                       cv_;
    std::unordered_map<std::string, std::shared_ptr<const DiagnosticSet>> sets_;
    std::atomic<std::uint64_t>                                            sequence_{0};
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_DIAGNOSTICS_CACHE_H
