//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Client-side tracking of documents opened on the language server.
///
/// The store owns the open/change/close notification protocol: it sends
/// `didOpen` once per document, bumps the version on every content change it
/// forwards, and only mutates tracking state after the notification was
/// written. Operations on one URI are serialized; different URIs proceed in
/// parallel.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_DOCUMENT_STORE_H
#define LSPBRIDGE_LSP_DOCUMENT_STORE_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lspbridge::lsp
{

/// @brief Snapshot of one tracked document.
struct DocumentSnapshot final
{
    /// @brief LSP document URI.
    std::string uri;

    /// @brief Language identifier sent with `didOpen`.
    std::string languageId;

    /// @brief Last text sent to the server.
    std::string text;

    /// @brief Last version sent to the server.
    std::int64_t version{0};
};

/// @brief Writes one document notification to the server.
using DocumentNotifier = std::function<llvm::Error(llvm::StringRef method, llvm::json::Value params)>;

/// @brief Tracks documents the server has been told about, keyed by URI.
class DocumentStore final
{
public:
    /// @brief Creates a store sending notifications through `notifier`.
    explicit DocumentStore(DocumentNotifier notifier);

    DocumentStore(const DocumentStore&)            = delete;
    DocumentStore& operator=(const DocumentStore&) = delete;

    /// @brief Replaces the notification path, for example after a restart.
    void setNotifier(DocumentNotifier notifier);

    /// @brief Opens a document on the server unless it is already tracked.
    /// @param[in] uri LSP document URI.
    /// @param[in] text Current document content.
    /// @return `true` when `didOpen` was sent, `false` when already open, or `SyncError`.
    [[nodiscard]] llvm::Expected<bool> ensureOpen(const std::string& uri, std::string text);

    /// @brief Forwards new content for an open document when it differs from the last snapshot.
    /// @param[in] uri LSP document URI.
    /// @param[in] text New full content.
    /// @return `true` when `didChange` was sent, or `SyncError` when not open or the send failed.
    [[nodiscard]] llvm::Expected<bool> notifyChange(const std::string& uri, std::string text);

    /// @brief Sends `didClose` and stops tracking the document.
    /// @param[in] uri LSP document URI.
    /// @return `SyncError` when not open or the send failed.
    [[nodiscard]] llvm::Error close(const std::string& uri);

    /// @brief Re-sends `didOpen` at version 1 for every tracked document.
    /// @return `SyncError` naming the documents that failed.
    [[nodiscard]] llvm::Error reopenAll();

    /// @brief Drops all tracking without notifying the server.
    void closeAll();

    /// @brief Returns a copy of the tracked snapshot for `uri`.
    [[nodiscard]] std::optional<DocumentSnapshot> lookup(const std::string& uri) const;

    /// @brief Returns whether `uri` is tracked as open.
    [[nodiscard]] bool isOpen(const std::string& uri) const;

    /// @brief Returns copies of all tracked snapshots, sorted by URI.
    [[nodiscard]] std::vector<DocumentSnapshot> snapshots() const;

    /// @brief Returns the number of tracked documents.
    [[nodiscard]] std::size_t size() const;

    /// @brief Returns the number of bookkeeping entries, including documents being opened.
    [[nodiscard]] std::size_t entryCount() const;

private:
    struct Entry final
    {
        std::mutex       mutex;
        bool             open{false};
        DocumentSnapshot snapshot;
    };

    [[nodiscard]] std::shared_ptr<Entry> findEntry(const std::string& uri) const;
    [[nodiscard]] std::shared_ptr<Entry> obtainEntry(const std::string& uri);
    [[nodiscard]] bool                   isCurrent(const std::string& uri, const std::shared_ptr<Entry>& entry) const;
    void                                 dropEntry(const std::string& uri, const std::shared_ptr<Entry>& entry);
    [[nodiscard]] llvm::Error            notify(llvm::StringRef method, llvm::json::Value params) const;

    mutable std::mutex                                      mapMutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    mutable std::mutex                                      notifierMutex_;
    DocumentNotifier                                        notifier_;
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_DOCUMENT_STORE_H
