//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements document open/change/close tracking.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/DocumentStore.h"

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/Protocol.h"
#include "lspbridge/LSP/Uri.h"

#include <algorithm>
#include <utility>

namespace lspbridge::lsp
{
namespace
{

std::string languageIdForUri(const std::string& uri)
{
    if (const auto path = uriToPath(uri))
    {
        return languageIdForPath(*path).str();
    }
    return languageIdForPath(uri).str();
}

llvm::json::Value didOpenParams(const DocumentSnapshot& snapshot)
{
    return llvm::json::Object{
        {"textDocument",
         llvm::json::Object{
             {"uri", snapshot.uri},
             {"languageId", snapshot.languageId},
             {"version", snapshot.version},
             {"text", snapshot.text},
         }},
    };
}

llvm::Error syncError(llvm::StringRef what, const std::string& uri, llvm::Error cause)
{
    return makeClientError(ErrorKind::SyncError,
                           what.str() + " failed for " + uri + ": " + llvm::toString(std::move(cause)));
}

}  // namespace

DocumentStore::DocumentStore(DocumentNotifier notifier)
    : notifier_(std::move(notifier))
{
}

void DocumentStore::setNotifier(DocumentNotifier notifier)
{
    std::lock_guard<std::mutex> lock(notifierMutex_);
    notifier_ = std::move(notifier);
}

llvm::Error DocumentStore::notify(llvm::StringRef method, llvm::json::Value params) const
{
    DocumentNotifier notifier;
    {
        std::lock_guard<std::mutex> lock(notifierMutex_);
        notifier = notifier_;
    }
    if (!notifier)
    {
        return makeClientError(ErrorKind::SessionClosed, "no active session");
    }
    return notifier(method, std::move(params));
}

std::shared_ptr<DocumentStore::Entry> DocumentStore::findEntry(const std::string& uri) const
{
    std::lock_guard<std::mutex> lock(mapMutex_);
    const auto                  it = entries_.find(uri);
    return it == entries_.end() ? nullptr : it->second;
}

std::shared_ptr<DocumentStore::Entry> DocumentStore::obtainEntry(const std::string& uri)
{
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto&                       entry = entries_[uri];
    if (!entry)
    {
        entry = std::make_shared<Entry>();
    }
    return entry;
}

bool DocumentStore::isCurrent(const std::string& uri, const std::shared_ptr<Entry>& entry) const
{
    std::lock_guard<std::mutex> lock(mapMutex_);
    const auto                  it = entries_.find(uri);
    return it != entries_.end() && it->second == entry;
}

void DocumentStore::dropEntry(const std::string& uri, const std::shared_ptr<Entry>& entry)
{
    std::lock_guard<std::mutex> lock(mapMutex_);
    const auto                  it = entries_.find(uri);
    if (it != entries_.end() && it->second == entry)
    {
        entries_.erase(it);
    }
}

llvm::Expected<bool> DocumentStore::ensureOpen(const std::string& uri, std::string text)
{
    while (true)
    {
        const auto                  entry = obtainEntry(uri);
        std::lock_guard<std::mutex> lock(entry->mutex);
        // A closed entry may have been dropped while this caller waited for it.
        if (!isCurrent(uri, entry))
        {
            continue;
        }
        if (entry->open)
        {
            return false;
        }

        DocumentSnapshot snapshot{uri, languageIdForUri(uri), std::move(text), 1};
        if (auto error = notify(methods::DidOpen, didOpenParams(snapshot)))
        {
            dropEntry(uri, entry);
            return syncError("didOpen", uri, std::move(error));
        }
        entry->snapshot = std::move(snapshot);
        entry->open     = true;
        return true;
    }
}

llvm::Expected<bool> DocumentStore::notifyChange(const std::string& uri, std::string text)
{
    const auto entry = findEntry(uri);
    if (!entry)
    {
        return makeClientError(ErrorKind::SyncError, "document is not open: " + uri);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->open)
    {
        return makeClientError(ErrorKind::SyncError, "document is not open: " + uri);
    }
    if (entry->snapshot.text == text)
    {
        return false;
    }

    const std::int64_t nextVersion = entry->snapshot.version + 1;
    llvm::json::Value  params      = llvm::json::Object{
        {"textDocument", llvm::json::Object{{"uri", uri}, {"version", nextVersion}}},
        {"contentChanges", llvm::json::Array{llvm::json::Object{{"text", text}}}},
    };
    if (auto error = notify(methods::DidChange, std::move(params)))
    {
        return syncError("didChange", uri, std::move(error));
    }
    entry->snapshot.text    = std::move(text);
    entry->snapshot.version = nextVersion;
    return true;
}

llvm::Error DocumentStore::close(const std::string& uri)
{
    const auto entry = findEntry(uri);
    if (!entry)
    {
        return makeClientError(ErrorKind::SyncError, "document is not open: " + uri);
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->open)
    {
        return makeClientError(ErrorKind::SyncError, "document is not open: " + uri);
    }
    if (auto error = notify(methods::DidClose, llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", uri}}}}))
    {
        return syncError("didClose", uri, std::move(error));
    }
    entry->open     = false;
    entry->snapshot = DocumentSnapshot{};
    dropEntry(uri, entry);
    return llvm::Error::success();
}

llvm::Error DocumentStore::reopenAll()
{
    std::vector<std::shared_ptr<Entry>> tracked;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        tracked.reserve(entries_.size());
        for (const auto& [_, entry] : entries_)
        {
            tracked.push_back(entry);
        }
    }

    std::vector<std::string> failed;
    for (const auto& entry : tracked)
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->open)
        {
            continue;
        }
        entry->snapshot.version = 1;
        if (auto error = notify(methods::DidOpen, didOpenParams(entry->snapshot)))
        {
            failed.push_back(entry->snapshot.uri + " (" + llvm::toString(std::move(error)) + ")");
        }
    }
    if (failed.empty())
    {
        return llvm::Error::success();
    }
    std::sort(failed.begin(), failed.end());
    std::string message = "failed to reopen:";
    for (const auto& item : failed)
    {
        message += " " + item;
    }
    return makeClientError(ErrorKind::SyncError, std::move(message));
}

void DocumentStore::closeAll()
{
    std::unordered_map<std::string, std::shared_ptr<Entry>> dropped;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        dropped.swap(entries_);
    }
    for (const auto& [_, entry] : dropped)
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->open = false;
    }
}

std::optional<DocumentSnapshot> DocumentStore::lookup(const std::string& uri) const
{
    const auto entry = findEntry(uri);
    if (!entry)
    {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->open)
    {
        return std::nullopt;
    }
    return entry->snapshot;
}

bool DocumentStore::isOpen(const std::string& uri) const
{
    return lookup(uri).has_value();
}

std::vector<DocumentSnapshot> DocumentStore::snapshots() const
{
    std::vector<std::shared_ptr<Entry>> tracked;
    {
        std::lock_guard<std::mutex> lock(mapMutex_);
        for (const auto& [_, entry] : entries_)
        {
            tracked.push_back(entry);
        }
    }
    std::vector<DocumentSnapshot> out;
    out.reserve(tracked.size());
    for (const auto& entry : tracked)
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->open)
        {
            out.push_back(entry->snapshot);
        }
    }
    std::sort(out.begin(), out.end(), [](const DocumentSnapshot& lhs, const DocumentSnapshot& rhs) {
        return lhs.uri < rhs.uri;
    });
    return out;
}

std::size_t DocumentStore::size() const
{
    return snapshots().size();
}

std::size_t DocumentStore::entryCount() const
{
    std::lock_guard<std::mutex> lock(mapMutex_);
    return entries_.size();
}

}  // namespace lspbridge::lsp
