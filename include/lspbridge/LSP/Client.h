//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Language-server client session.
///
/// A `Client` owns one server session at a time: it spawns (or attaches to)
/// the server, performs the `initialize` handshake, keeps the server's view of
/// opened documents in sync with disk, and exposes typed navigation queries
/// with one-indexed positions. Every typed operation is safe to call from any
/// thread once the session is initialized.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_CLIENT_H
#define LSPBRIDGE_LSP_CLIENT_H

#include "lspbridge/LSP/ClientConfig.h"
#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/DiagnosticsCache.h"
#include "lspbridge/LSP/DocumentStore.h"
#include "lspbridge/LSP/Logger.h"
#include "lspbridge/LSP/NotificationDispatcher.h"
#include "lspbridge/LSP/ProcessSupervisor.h"
#include "lspbridge/LSP/Protocol.h"
#include "lspbridge/LSP/RequestRegistry.h"
#include "lspbridge/LSP/Telemetry.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lspbridge::lsp
{

/// @brief Lifecycle state of the client session.
enum class SessionState
{
    /// @brief No server has been started.
    Idle,

    /// @brief The server is running and the handshake has not completed.
    Starting,

    /// @brief The handshake completed; typed operations are accepted.
    Initialized,

    /// @brief `shutdown` is in progress.
    ShuttingDown,

    /// @brief The session ended, by request or by server failure.
    Terminated,
};

/// @brief Returns the display name of a session state.
[[nodiscard]] llvm::StringRef sessionStateName(SessionState state);

/// @brief Reads the current content of a file.
using FileReader = std::function<llvm::Expected<std::string>(llvm::StringRef path)>;

/// @brief Returns a reader that loads files from disk.
[[nodiscard]] FileReader diskFileReader();

/// @brief Optional integration points supplied by the embedding application.
struct ClientHooks final
{
    /// @brief File reader; defaults to `diskFileReader()`.
    FileReader fileReader;

    /// @brief Log sink; defaults to `Logger::stderrSink()`.
    LogSink logSink;

    /// @brief Request telemetry sink.
    RequestMetricSink metricSink;
};

/// @brief Per-call options for requests.
struct RequestOptions final
{
    /// @brief Overrides the configured request timeout.
    std::optional<std::chrono::milliseconds> timeout;

    /// @brief Token the caller may trigger to abandon the call.
    std::optional<CancellationToken> cancellation;
};

/// @brief Language-server client with typed navigation operations.
class Client final
{
public:
    /// @brief Creates an idle client.
    /// @param[in] config Client configuration.
    /// @param[in] hooks Integration hooks.
    explicit Client(ClientConfig config, ClientHooks hooks = {});

    /// @brief Shuts the session down if one is running.
    ~Client();

    Client(const Client&)            = delete;
    Client& operator=(const Client&) = delete;

    /// @name Lifecycle
    /// @{

    /// @brief Spawns the configured server and performs the handshake.
    ///
    /// Documents still tracked from a session the server ended are re-opened on the new server.
    /// @return `SpawnFailed`, `SessionClosed` after `shutdown()`, a handshake failure, or success.
    [[nodiscard]] llvm::Error start();

    /// @brief Binds the client to an already connected server stream pair.
    ///
    /// The session enters `Starting`; call `initialize()` next. Writes to `out` are not bounded
    /// by the client, so `out` should fail rather than block forever on a stalled peer.
    /// @param[in] in Stream carrying server output.
    /// @param[in] out Stream feeding server input.
    /// @param[in] disconnect Callback that makes `in` reach end of stream; run on teardown.
    [[nodiscard]] llvm::Error attach(std::istream& in, std::ostream& out, std::function<void()> disconnect);

    /// @brief Performs the `initialize`/`initialized` handshake.
    [[nodiscard]] llvm::Error initialize();

    /// @brief Sends `shutdown` and `exit`, then releases the server. Idempotent.
    ///
    /// The client accepts no new session afterwards.
    [[nodiscard]] llvm::Error shutdown();

    /// @brief Replaces the session with a freshly spawned server and re-opens tracked documents.
    [[nodiscard]] llvm::Error restart();

    /// @}

    /// @name Typed operations
    /// Positions are one-indexed; `line` and `column` below `1` fail with `InvalidArgument`.
    /// @{

    [[nodiscard]] llvm::Expected<std::vector<Location>> definition(llvm::StringRef       path,
                                                                   std::int64_t          line,
                                                                   std::int64_t          column,
                                                                   const RequestOptions& options = {});

    /// @brief Finds references, excluding the declaration itself.
    [[nodiscard]] llvm::Expected<std::vector<Location>> references(llvm::StringRef       path,
                                                                   std::int64_t          line,
                                                                   std::int64_t          column,
                                                                   const RequestOptions& options = {});

    [[nodiscard]] llvm::Expected<std::vector<Location>> implementation(llvm::StringRef       path,
                                                                       std::int64_t          line,
                                                                       std::int64_t          column,
                                                                       const RequestOptions& options = {});

    [[nodiscard]] llvm::Expected<std::vector<Location>> typeDefinition(llvm::StringRef       path,
                                                                       std::int64_t          line,
                                                                       std::int64_t          column,
                                                                       const RequestOptions& options = {});

    /// @brief Returns hover content, or `std::nullopt` when the server has none.
    [[nodiscard]] llvm::Expected<std::optional<HoverResult>> hover(llvm::StringRef       path,
                                                                   std::int64_t          line,
                                                                   std::int64_t          column,
                                                                   const RequestOptions& options = {});

    /// @brief Computes the edits for renaming the symbol at a position. Edits are not applied.
    [[nodiscard]] llvm::Expected<WorkspaceEditSet> rename(llvm::StringRef       path,
                                                          std::int64_t          line,
                                                          std::int64_t          column,
                                                          llvm::StringRef       newName,
                                                          const RequestOptions& options = {});

    /// @brief Returns the document's symbols flattened in pre-order.
    [[nodiscard]] llvm::Expected<std::vector<SymbolEntry>> documentSymbols(llvm::StringRef       path,
                                                                           const RequestOptions& options = {});

    /// @brief Requests diagnostics with `textDocument/diagnostic`.
    [[nodiscard]] llvm::Expected<DiagnosticSet> pullDiagnostics(llvm::StringRef       path,
                                                                const RequestOptions& options = {});

    /// @}

    /// @brief Opens (or re-syncs) a document on the server.
    [[nodiscard]] llvm::Error openFile(llvm::StringRef path);

    /// @brief Closes a document on the server.
    [[nodiscard]] llvm::Error closeFile(llvm::StringRef path);

    /// @brief Returns the latest published diagnostics for a document, possibly empty.
    [[nodiscard]] DiagnosticSet diagnostics(llvm::StringRef path) const;

    /// @brief Syncs a document and waits for a diagnostics push newer than the current one.
    /// @param[in] path File path.
    /// @param[in] timeout Maximum wait; the configured diagnostics wait when `std::nullopt`.
    /// @return The newest set, which may be the previous one when the wait elapsed.
    [[nodiscard]] llvm::Expected<DiagnosticSet> waitForDiagnostics(
        llvm::StringRef                          path,
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @brief Sends an arbitrary request and returns its raw result.
    [[nodiscard]] llvm::Expected<llvm::json::Value> sendRequest(llvm::StringRef       method,
                                                                llvm::json::Value     params,
                                                                const RequestOptions& options = {});

    /// @brief Sends an arbitrary notification.
    [[nodiscard]] llvm::Error sendNotification(llvm::StringRef method, llvm::json::Value params);

    [[nodiscard]] SessionState state() const;

    /// @brief Returns the capabilities the server announced during the handshake.
    [[nodiscard]] llvm::json::Value serverCapabilities() const;

    /// @brief Returns how the most recent server process ended, if one has.
    [[nodiscard]] std::optional<ProcessExit> lastExit() const;

    /// @brief Returns the stderr tail of the running server process.
    [[nodiscard]] std::vector<std::string> serverStderrTail() const;

    [[nodiscard]] const ClientConfig& config() const
    {
        return config_;
    }

    [[nodiscard]] Logger& logger()
    {
        return logger_;
    }

    [[nodiscard]] Telemetry& telemetry()
    {
        return telemetry_;
    }

    [[nodiscard]] const DocumentStore& documents() const
    {
        return documents_;
    }

private:
    struct Session;

    [[nodiscard]] llvm::Error                        startLocked();
    [[nodiscard]] llvm::Error                        initializeLocked();
    [[nodiscard]] llvm::Error                        shutdownLocked();
    [[nodiscard]] llvm::Error                        bindSession(std::shared_ptr<Session> session);
    void                                             teardownSession(const std::shared_ptr<Session>& session);
    void                                             onSessionLost(std::uint64_t generation, const std::string& reason);
    void                                             installDefaultHandlers();
    [[nodiscard]] std::shared_ptr<Session>           currentSession() const;
    [[nodiscard]] llvm::Error                        requireReady() const;
    [[nodiscard]] llvm::Error                        notify(llvm::StringRef method, llvm::json::Value params);
    [[nodiscard]] llvm::Expected<llvm::json::Value>  call(llvm::StringRef             method,
                                                          llvm::json::Value           params,
                                                          std::chrono::milliseconds   timeout,
                                                          const std::optional<CancellationToken>& cancellation);
    [[nodiscard]] llvm::Expected<std::string>        syncDocument(llvm::StringRef path);
    [[nodiscard]] llvm::Expected<llvm::json::Object> positionParams(llvm::StringRef path,
                                                                    std::int64_t    line,
                                                                    std::int64_t    column);
    [[nodiscard]] llvm::Expected<std::vector<Location>> locationQuery(llvm::StringRef       method,
                                                                      llvm::StringRef       path,
                                                                      std::int64_t          line,
                                                                      std::int64_t          column,
                                                                      const RequestOptions& options);
    [[nodiscard]] std::chrono::milliseconds timeoutFor(const RequestOptions& options) const;
    [[nodiscard]] llvm::json::Value         initializeParams() const;
    void                                    handlePublishDiagnostics(const llvm::json::Value& params);
    [[nodiscard]] llvm::Error               rejectIfShutDown() const;

    ClientConfig                config_;
    Logger                      logger_;
    Telemetry                   telemetry_;
    FileReader                  fileReader_;
    ProcessSupervisor           supervisor_;
    DiagnosticsCache            diagnostics_;
    DocumentStore               documents_;
    std::mutex                  lifecycleMutex_;
    mutable std::mutex          stateMutex_;
    std::shared_ptr<Session>    session_;
    SessionState                state_{SessionState::Idle};
    std::uint64_t               generation_{0};
    llvm::json::Value           capabilities_{llvm::json::Object{}};
    std::optional<ProcessExit>  lastExit_;
    bool                        shutdownRequested_{false};
    std::atomic<std::int64_t>   nextId_{1};
    RequestRegistry             registry_;
    NotificationDispatcher      dispatcher_;
};

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_CLIENT_H
