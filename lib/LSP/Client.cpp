//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the language-server client session and its typed operations.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Client.h"

#include "lspbridge/LSP/Transport.h"
#include "lspbridge/LSP/Uri.h"
#include "lspbridge/Version.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"

#include <utility>

#include <unistd.h>

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral Component  = "client";
constexpr llvm::StringLiteral ClientName = "lspbridge";

constexpr std::chrono::milliseconds CancellationPollInterval{20};

llvm::json::Value clientCapabilities()
{
    return llvm::json::Object{
        {"general", llvm::json::Object{{"positionEncodings", llvm::json::Array{"utf-16"}}}},
        {"textDocument",
         llvm::json::Object{
             {"synchronization", llvm::json::Object{{"dynamicRegistration", false}, {"didSave", false}}},
             {"definition", llvm::json::Object{{"linkSupport", true}}},
             {"typeDefinition", llvm::json::Object{{"linkSupport", true}}},
             {"implementation", llvm::json::Object{{"linkSupport", true}}},
             {"references", llvm::json::Object{}},
             {"hover", llvm::json::Object{{"contentFormat", llvm::json::Array{"markdown", "plaintext"}}}},
             {"rename", llvm::json::Object{{"prepareSupport", false}}},
             {"documentSymbol", llvm::json::Object{{"hierarchicalDocumentSymbolSupport", true}}},
             {"publishDiagnostics", llvm::json::Object{{"versionSupport", true}}},
             {"diagnostic", llvm::json::Object{{"dynamicRegistration", false}}},
         }},
        {"workspace",
         llvm::json::Object{
             {"workspaceEdit", llvm::json::Object{{"documentChanges", true}}},
             {"workspaceFolders", true},
             {"configuration", true},
             {"applyEdit", false},
         }},
        {"window", llvm::json::Object{{"workDoneProgress", true}}},
    };
}

llvm::StringRef traceSetting(const TraceLevel level)
{
    switch (level)
    {
    case TraceLevel::Off:
        return "off";
    case TraceLevel::Basic:
        return "messages";
    case TraceLevel::Verbose:
        return "verbose";
    }
    return "off";
}

llvm::json::Value textDocumentParams(const std::string& uri)
{
    return llvm::json::Object{{"textDocument", llvm::json::Object{{"uri", uri}}}};
}

}  // namespace

llvm::StringRef sessionStateName(const SessionState state)
{
    switch (state)
    {
    case SessionState::Idle:
        return "idle";
    case SessionState::Starting:
        return "starting";
    case SessionState::Initialized:
        return "initialized";
    case SessionState::ShuttingDown:
        return "shutting-down";
    case SessionState::Terminated:
        return "terminated";
    }
    return "unknown";
}

FileReader diskFileReader()
{
    return [](llvm::StringRef path) -> llvm::Expected<std::string> {
        auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/true);
        if (!buffer)
        {
            return makeClientError(ErrorKind::InvalidArgument,
                                   "cannot read '" + path.str() + "': " + buffer.getError().message());
        }
        return (*buffer)->getBuffer().str();
    };
}

/// One connected server: an optional child process plus the transport over its pipes.
struct Client::Session final
{
    std::uint64_t                  generation{0};
    std::unique_ptr<ServerProcess> process;
    std::function<void()>          disconnect;
    std::unique_ptr<Transport>     transport;
};

Client::Client(ClientConfig config, ClientHooks hooks)
    : config_(std::move(config))
    , logger_(hooks.logSink ? std::move(hooks.logSink) : Logger::stderrSink(), config_.traceLevel)
    , fileReader_(hooks.fileReader ? std::move(hooks.fileReader) : diskFileReader())
    , supervisor_(logger_, config_.stderrTailLines)
    , documents_([this](llvm::StringRef method, llvm::json::Value params) { return notify(method, std::move(params)); })
    , registry_(logger_, config_.lateResponseRetention)
    , dispatcher_(logger_)
{
    telemetry_.setSink(std::move(hooks.metricSink));
    registry_.setTimeoutHandler([this](const std::int64_t id, const std::string& method) {
        if (auto error = notify(methods::CancelRequest, llvm::json::Object{{"id", id}}))
        {
            logger_.verbose(Component,
                            "could not cancel '" + method + "': " + llvm::toString(std::move(error)));
        }
    });
    installDefaultHandlers();
}

Client::~Client()
{
    if (auto error = shutdown())
    {
        logger_.basic(Component, "shutdown failed: " + llvm::toString(std::move(error)));
    }
    dispatcher_.shutdown();
    registry_.shutdown();
}

void Client::installDefaultHandlers()
{
    dispatcher_.setReplySender([this](llvm::json::Value reply) -> llvm::Error {
        const auto session = currentSession();
        if (!session)
        {
            return makeClientError(ErrorKind::SessionClosed, "no active session");
        }
        return session->transport->send(reply);
    });

    dispatcher_.onFrameError([this](const std::string& error) { logger_.basic(Component, "frame error: " + error); });

    dispatcher_.onNotification(methods::PublishDiagnostics.str(),
                               [this](const llvm::json::Value& params) { handlePublishDiagnostics(params); });

    dispatcher_.onNotification(methods::LogMessage.str(), [this](const llvm::json::Value& params) {
        const auto* object = params.getAsObject();
        if (!object)
        {
            return;
        }
        const auto message = object->getString("message");
        const auto type    = object->getInteger("type");
        if (!message)
        {
            return;
        }
        // MessageType: 1 error, 2 warning, 3 info, 4 log.
        const TraceLevel level = type && *type <= 2 ? TraceLevel::Basic : TraceLevel::Verbose;
        logger_.log(level, "server-log", *message);
    });

    dispatcher_.onNotification(methods::ShowMessage.str(), [this](const llvm::json::Value& params) {
        if (const auto* object = params.getAsObject())
        {
            if (const auto message = object->getString("message"))
            {
                logger_.basic("server-message", *message);
            }
        }
    });

    dispatcher_.onNotification(methods::Progress.str(), [](const llvm::json::Value&) {});

    dispatcher_.onRequest(methods::Configuration.str(), [](const llvm::json::Value& params) -> llvm::Expected<llvm::json::Value> {
        llvm::json::Array answers;
        if (const auto* object = params.getAsObject())
        {
            if (const auto* items = object->getArray("items"))
            {
                for (std::size_t i = 0; i < items->size(); ++i)
                {
                    answers.push_back(nullptr);
                }
            }
        }
        return llvm::json::Value(std::move(answers));
    });

    const auto acknowledge = [](const llvm::json::Value&) -> llvm::Expected<llvm::json::Value> {
        return llvm::json::Value(nullptr);
    };
    dispatcher_.onRequest(methods::WorkDoneProgressCreate.str(), acknowledge);
    dispatcher_.onRequest(methods::RegisterCapability.str(), acknowledge);
    dispatcher_.onRequest(methods::UnregisterCapability.str(), acknowledge);

    dispatcher_.onRequest(methods::ApplyEdit.str(), [](const llvm::json::Value&) -> llvm::Expected<llvm::json::Value> {
        return llvm::json::Object{{"applied", false}, {"failureReason", "edits are returned to the caller, not applied"}};
    });
}

void Client::handlePublishDiagnostics(const llvm::json::Value& params)
{
    const auto* object = params.getAsObject();
    if (!object)
    {
        return;
    }
    const auto uri = object->getString("uri");
    if (!uri)
    {
        logger_.basic(Component, "publishDiagnostics without uri");
        return;
    }

    std::vector<DiagnosticEntry> entries;
    if (const auto* array = object->get("diagnostics"))
    {
        auto decoded = decodeDiagnostics(*array);
        if (!decoded)
        {
            logger_.basic(Component,
                          "ignoring diagnostics for " + uri->str() + ": " + llvm::toString(decoded.takeError()));
            return;
        }
        entries = std::move(*decoded);
    }

    DiagnosticStamp stamp;
    stamp.sequence = diagnostics_.nextSequence();
    if (const auto version = object->getInteger("version"))
    {
        // Versions are only comparable within one open of the document.
        const auto tracked = documents_.lookup(uri->str());
        if (tracked && *version > tracked->version)
        {
            logger_.verbose(Component, "dropping diagnostics for an earlier open of " + uri->str());
            return;
        }
        if (tracked)
        {
            stamp.documentVersion = *version;
        }
    }
    if (!diagnostics_.update(uri->str(), std::move(entries), stamp))
    {
        logger_.verbose(Component, "dropping stale diagnostics for " + uri->str());
    }
}

std::shared_ptr<Client::Session> Client::currentSession() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return session_;
}

SessionState Client::state() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return state_;
}

llvm::json::Value Client::serverCapabilities() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return capabilities_;
}

std::optional<ProcessExit> Client::lastExit() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastExit_;
}

std::vector<std::string> Client::serverStderrTail() const
{
    const auto session = currentSession();
    if (!session || !session->process)
    {
        return {};
    }
    return session->process->stderrTail();
}

llvm::Error Client::requireReady() const
{
    const SessionState current = state();
    switch (current)
    {
    case SessionState::Initialized:
        return llvm::Error::success();
    case SessionState::Terminated:
        return makeClientError(ErrorKind::SessionClosed, "the language server session has terminated");
    default:
        return makeClientError(ErrorKind::NotReady,
                               "the language server session is not initialized (state: " +
                                   sessionStateName(current).str() + ")");
    }
}

void Client::onSessionLost(const std::uint64_t generation, const std::string& reason)
{
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (generation != generation_)
        {
            return;
        }
        if (state_ == SessionState::Starting || state_ == SessionState::Initialized)
        {
            state_ = SessionState::Terminated;
            logger_.basic(Component, "language server session lost: " + reason);
        }
    }
    registry_.failAll("language server session ended: " + reason);
}

llvm::Error Client::bindSession(std::shared_ptr<Session> session)
{
    const std::uint64_t generation = session->generation;
    Transport::Handlers handlers;
    handlers.onResponse = [this](llvm::json::Value response) {
        switch (registry_.routeResponse(response))
        {
        case FulfillStatus::Delivered:
            break;
        case FulfillStatus::Late:
            logger_.verbose(Component, "dropping late response");
            break;
        case FulfillStatus::Unknown:
            logger_.verbose(Component, "dropping response with unknown id");
            break;
        }
    };
    handlers.onInbound    = [this](llvm::json::Value message) { dispatcher_.enqueue(std::move(message)); };
    handlers.onFrameError = [this](std::string error) { dispatcher_.reportFrameError(std::move(error)); };
    handlers.onClosed     = [this, generation](std::string reason) { onSessionLost(generation, reason); };
    session->transport->setHandlers(std::move(handlers));

    registry_.reopen();
    diagnostics_.clear();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        session_      = session;
        state_        = SessionState::Starting;
        capabilities_ = llvm::json::Object{};
    }
    session->transport->start();
    return llvm::Error::success();
}

void Client::teardownSession(const std::shared_ptr<Session>& session)
{
    if (!session)
    {
        return;
    }
    session->transport->closeOutput([&session]() {
        if (session->process)
        {
            session->process->closeInput();
        }
    });
    if (session->process)
    {
        const ProcessExit exit = session->process->terminate(config_.shutdownTimeout);
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastExit_ = exit;
    }
    if (session->disconnect)
    {
        session->disconnect();
    }
    session->transport->join();

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (session_ == session)
    {
        session_.reset();
    }
}

llvm::Error Client::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (auto error = startLocked())
    {
        return error;
    }
    return initializeLocked();
}

llvm::Error Client::rejectIfShutDown() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (shutdownRequested_)
    {
        return makeClientError(ErrorKind::SessionClosed, "the client was shut down");
    }
    return llvm::Error::success();
}

llvm::Error Client::startLocked()
{
    if (auto error = rejectIfShutDown())
    {
        return error;
    }
    const SessionState current = state();
    if (current == SessionState::Starting || current == SessionState::Initialized)
    {
        return makeClientError(ErrorKind::InvalidArgument, "a language server session is already running");
    }
    // Release what is left of a session the server ended on its own.
    teardownSession(currentSession());

    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        generation = ++generation_;
    }

    auto process = supervisor_.start(config_.command, [this, generation](const ProcessExit& exit) {
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            lastExit_ = exit;
        }
        onSessionLost(generation, "server " + exit.describe());
    });
    if (!process)
    {
        return process.takeError();
    }

    (*process)->setInputWriteTimeout(config_.writeTimeout);

    auto session        = std::make_shared<Session>();
    session->generation = generation;
    session->process    = std::move(*process);
    session->transport =
        std::make_unique<Transport>(session->process->output(), session->process->input(), logger_);
    return bindSession(std::move(session));
}

llvm::Error Client::attach(std::istream& in, std::ostream& out, std::function<void()> disconnect)
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (auto error = rejectIfShutDown())
    {
        return error;
    }
    const SessionState current = state();
    if (current == SessionState::Starting || current == SessionState::Initialized)
    {
        return makeClientError(ErrorKind::InvalidArgument, "a language server session is already running");
    }
    // Release what is left of a session the server ended on its own.
    teardownSession(currentSession());

    auto session = std::make_shared<Session>();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        session->generation = ++generation_;
    }
    session->disconnect = std::move(disconnect);
    session->transport  = std::make_unique<Transport>(in, out, logger_);
    return bindSession(std::move(session));
}

llvm::json::Value Client::initializeParams() const
{
    llvm::json::Object params{
        {"processId", static_cast<std::int64_t>(::getpid())},
        {"clientInfo", llvm::json::Object{{"name", ClientName}, {"version", kVersionString}}},
        {"capabilities", clientCapabilities()},
        {"trace", traceSetting(config_.traceLevel)},
    };

    if (config_.rootPath.empty())
    {
        params["rootUri"]          = nullptr;
        params["workspaceFolders"] = nullptr;
    }
    else
    {
        const std::string rootUri = pathToUri(config_.rootPath);
        params["rootUri"]         = rootUri;
        params["rootPath"]        = config_.rootPath;
        params["workspaceFolders"] = llvm::json::Array{llvm::json::Object{
            {"uri", rootUri},
            {"name", llvm::sys::path::filename(llvm::StringRef(config_.rootPath).rtrim('/')).str()},
        }};
    }
    if (config_.initializationOptions)
    {
        params["initializationOptions"] = *config_.initializationOptions;
    }
    return params;
}

llvm::Error Client::initialize()
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    return initializeLocked();
}

llvm::Error Client::initializeLocked()
{
    const SessionState current = state();
    if (current == SessionState::Initialized)
    {
        return llvm::Error::success();
    }
    if (current != SessionState::Starting)
    {
        return makeClientError(ErrorKind::NotReady,
                               "cannot initialize in state " + sessionStateName(current).str());
    }

    auto result = call(methods::Initialize, initializeParams(), config_.initializeTimeout, std::nullopt);
    if (!result)
    {
        llvm::Error error = result.takeError();
        logger_.basic(Component, "initialize failed; releasing the server");
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            state_ = SessionState::ShuttingDown;
        }
        teardownSession(currentSession());
        registry_.failAll("initialize failed");
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            state_ = SessionState::Terminated;
        }
        return error;
    }

    llvm::json::Value capabilities = llvm::json::Object{};
    if (const auto* object = result->getAsObject())
    {
        if (const auto* announced = object->get("capabilities"))
        {
            capabilities = *announced;
        }
        if (const auto* info = object->getObject("serverInfo"))
        {
            if (const auto name = info->getString("name"))
            {
                std::string text = "connected to " + name->str();
                if (const auto version = info->getString("version"))
                {
                    text += " " + version->str();
                }
                logger_.basic(Component, text);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (state_ != SessionState::Starting)
        {
            return makeClientError(ErrorKind::SessionClosed, "the language server exited during initialize");
        }
        capabilities_ = std::move(capabilities);
        state_        = SessionState::Initialized;
    }
    if (auto error = notify(methods::Initialized, llvm::json::Object{}))
    {
        return error;
    }
    // A new server knows none of the documents the caller still considers active.
    return documents_.reopenAll();
}

llvm::Error Client::shutdown()
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    return shutdownLocked();
}

llvm::Error Client::shutdownLocked()
{
    SessionState previous = SessionState::Idle;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        shutdownRequested_ = true;
        previous           = state_;
        if (state_ == SessionState::Idle || (state_ == SessionState::Terminated && !session_))
        {
            return llvm::Error::success();
        }
        state_ = SessionState::ShuttingDown;
    }

    const auto session = currentSession();
    if (session && previous == SessionState::Initialized && !session->transport->isClosed())
    {
        auto reply = call(methods::Shutdown, nullptr, config_.shutdownTimeout, std::nullopt);
        if (!reply)
        {
            // The server is released regardless; a dead or slow server must not block shutdown.
            logger_.basic(Component, "shutdown request failed: " + llvm::toString(reply.takeError()));
        }
        if (auto error = notify(methods::Exit, nullptr))
        {
            logger_.verbose(Component, "exit notification failed: " + llvm::toString(std::move(error)));
        }
    }

    teardownSession(session);
    registry_.failAll("language server session shut down");
    dispatcher_.drain();
    documents_.closeAll();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = SessionState::Terminated;
    }
    return llvm::Error::success();
}

llvm::Error Client::restart()
{
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
    if (auto error = rejectIfShutDown())
    {
        return error;
    }
    logger_.basic(Component, "restarting language server");

    SessionState previous = SessionState::Idle;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        previous = state_;
        state_   = SessionState::ShuttingDown;
    }
    const auto session = currentSession();
    if (session && previous == SessionState::Initialized && !session->transport->isClosed())
    {
        auto reply = call(methods::Shutdown, nullptr, config_.shutdownTimeout, std::nullopt);
        if (!reply)
        {
            logger_.basic(Component, "shutdown request failed: " + llvm::toString(reply.takeError()));
        }
        if (auto error = notify(methods::Exit, nullptr))
        {
            logger_.verbose(Component, "exit notification failed: " + llvm::toString(std::move(error)));
        }
    }
    teardownSession(session);
    registry_.failAll("language server restarted");
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        state_ = SessionState::Terminated;
    }

    if (auto error = startLocked())
    {
        return error;
    }
    return initializeLocked();
}

llvm::Error Client::notify(llvm::StringRef method, llvm::json::Value params)
{
    const auto session = currentSession();
    if (!session)
    {
        return makeClientError(ErrorKind::SessionClosed, "no active language server session");
    }
    return session->transport->send(makeNotification(method, std::move(params)));
}

llvm::Expected<llvm::json::Value> Client::call(llvm::StringRef                         method,
                                               llvm::json::Value                       params,
                                               const std::chrono::milliseconds         timeout,
                                               const std::optional<CancellationToken>& cancellation)
{
    const auto session = currentSession();
    if (!session)
    {
        return makeClientError(ErrorKind::SessionClosed, "no active language server session");
    }

    const std::int64_t id      = nextId_.fetch_add(1, std::memory_order_relaxed);
    const auto         started = std::chrono::steady_clock::now();
    auto               pending = registry_.registerCall(id, method.str(), started + timeout);
    if (!pending)
    {
        return pending.takeError();
    }

    if (auto error = session->transport->send(makeRequest(id, method, std::move(params))))
    {
        registry_.fulfillError(id, ErrorKind::TransportFault, "request was not sent");
        telemetry_.record(method.str(), 0, RequestOutcome::Failed);
        return std::move(error);
    }

    if (cancellation)
    {
        while (!pending->waitFor(CancellationPollInterval))
        {
            if (cancellation->isCancellationRequested() &&
                registry_.cancel(id, ErrorKind::Cancelled, "'" + method.str() + "' was cancelled"))
            {
                if (auto error = notify(methods::CancelRequest, llvm::json::Object{{"id", id}}))
                {
                    logger_.verbose(Component, "could not send cancellation: " + llvm::toString(std::move(error)));
                }
            }
        }
    }

    auto           result        = pending->wait();
    const auto     finished      = std::chrono::steady_clock::now();
    const auto     latencyMicros = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(finished - started).count());
    RequestOutcome outcome = RequestOutcome::Completed;
    if (!result)
    {
        llvm::Error error = llvm::handleErrors(result.takeError(),
                                               [&](std::unique_ptr<ClientError> failure) -> llvm::Error {
                                                   outcome = requestOutcomeFor(failure->kind());
                                                   return llvm::Error(std::move(failure));
                                               });
        if (outcome == RequestOutcome::Completed)
        {
            outcome = RequestOutcome::Failed;
        }
        telemetry_.record(method.str(), latencyMicros, outcome);
        return std::move(error);
    }
    telemetry_.record(method.str(), latencyMicros, outcome);
    return result;
}

std::chrono::milliseconds Client::timeoutFor(const RequestOptions& options) const
{
    return options.timeout ? *options.timeout : config_.requestTimeout;
}

llvm::Expected<std::string> Client::syncDocument(llvm::StringRef path)
{
    if (path.empty())
    {
        return makeClientError(ErrorKind::InvalidArgument, "empty file path");
    }
    auto text = fileReader_(path);
    if (!text)
    {
        return text.takeError();
    }

    std::string uri    = pathToUri(path);
    auto        opened = documents_.ensureOpen(uri, *text);
    if (!opened)
    {
        return opened.takeError();
    }
    if (!*opened)
    {
        auto changed = documents_.notifyChange(uri, std::move(*text));
        if (!changed)
        {
            return changed.takeError();
        }
    }
    return uri;
}

llvm::Expected<llvm::json::Object> Client::positionParams(llvm::StringRef    path,
                                                          const std::int64_t line,
                                                          const std::int64_t column)
{
    if (auto error = requireReady())
    {
        return std::move(error);
    }
    auto position = makeSourcePosition(line, column);
    if (!position)
    {
        return position.takeError();
    }
    auto uri = syncDocument(path);
    if (!uri)
    {
        return uri.takeError();
    }
    return textDocumentPositionParams(*uri, *position);
}

llvm::Expected<std::vector<Location>> Client::locationQuery(llvm::StringRef       method,
                                                            llvm::StringRef       path,
                                                            const std::int64_t    line,
                                                            const std::int64_t    column,
                                                            const RequestOptions& options)
{
    auto params = positionParams(path, line, column);
    if (!params)
    {
        return params.takeError();
    }
    if (method == methods::References)
    {
        (*params)["context"] = llvm::json::Object{{"includeDeclaration", false}};
    }
    auto result = call(method, std::move(*params), timeoutFor(options), options.cancellation);
    if (!result)
    {
        return result.takeError();
    }
    return decodeLocations(*result);
}

llvm::Expected<std::vector<Location>> Client::definition(llvm::StringRef       path,
                                                         const std::int64_t    line,
                                                         const std::int64_t    column,
                                                         const RequestOptions& options)
{
    return locationQuery(methods::Definition, path, line, column, options);
}

llvm::Expected<std::vector<Location>> Client::references(llvm::StringRef       path,
                                                         const std::int64_t    line,
                                                         const std::int64_t    column,
                                                         const RequestOptions& options)
{
    return locationQuery(methods::References, path, line, column, options);
}

llvm::Expected<std::vector<Location>> Client::implementation(llvm::StringRef       path,
                                                             const std::int64_t    line,
                                                             const std::int64_t    column,
                                                             const RequestOptions& options)
{
    return locationQuery(methods::Implementation, path, line, column, options);
}

llvm::Expected<std::vector<Location>> Client::typeDefinition(llvm::StringRef       path,
                                                             const std::int64_t    line,
                                                             const std::int64_t    column,
                                                             const RequestOptions& options)
{
    return locationQuery(methods::TypeDefinition, path, line, column, options);
}

llvm::Expected<std::optional<HoverResult>> Client::hover(llvm::StringRef       path,
                                                         const std::int64_t    line,
                                                         const std::int64_t    column,
                                                         const RequestOptions& options)
{
    auto params = positionParams(path, line, column);
    if (!params)
    {
        return params.takeError();
    }
    auto result = call(methods::Hover, std::move(*params), timeoutFor(options), options.cancellation);
    if (!result)
    {
        return result.takeError();
    }
    return decodeHover(*result);
}

llvm::Expected<WorkspaceEditSet> Client::rename(llvm::StringRef       path,
                                                const std::int64_t    line,
                                                const std::int64_t    column,
                                                llvm::StringRef       newName,
                                                const RequestOptions& options)
{
    if (newName.trim().empty())
    {
        return makeClientError(ErrorKind::InvalidArgument, "rename requires a non-empty new name");
    }
    auto params = positionParams(path, line, column);
    if (!params)
    {
        return params.takeError();
    }
    (*params)["newName"] = newName.str();
    auto result          = call(methods::Rename, std::move(*params), timeoutFor(options), options.cancellation);
    if (!result)
    {
        return result.takeError();
    }
    return decodeWorkspaceEdit(*result);
}

llvm::Expected<std::vector<SymbolEntry>> Client::documentSymbols(llvm::StringRef path, const RequestOptions& options)
{
    if (auto error = requireReady())
    {
        return std::move(error);
    }
    auto uri = syncDocument(path);
    if (!uri)
    {
        return uri.takeError();
    }
    auto result = call(methods::DocumentSymbol, textDocumentParams(*uri), timeoutFor(options), options.cancellation);
    if (!result)
    {
        return result.takeError();
    }
    return decodeDocumentSymbols(*result);
}

llvm::Expected<DiagnosticSet> Client::pullDiagnostics(llvm::StringRef path, const RequestOptions& options)
{
    if (auto error = requireReady())
    {
        return std::move(error);
    }
    auto uri = syncDocument(path);
    if (!uri)
    {
        return uri.takeError();
    }
    auto result = call(methods::Diagnostic, textDocumentParams(*uri), timeoutFor(options), options.cancellation);
    if (!result)
    {
        return result.takeError();
    }

    const auto* report = result->getAsObject();
    if (!report)
    {
        return makeClientError(ErrorKind::InvalidResponse, "diagnostic report is not an object");
    }
    const auto kind = report->getString("kind");
    if (kind && *kind == "unchanged")
    {
        return diagnostics_.snapshot(*uri);
    }
    if (!kind || *kind != "full")
    {
        return makeClientError(ErrorKind::InvalidResponse, "diagnostic report has no 'full' or 'unchanged' kind");
    }
    const auto* items = report->get("items");
    if (!items)
    {
        return makeClientError(ErrorKind::InvalidResponse, "full diagnostic report has no items");
    }
    auto entries = decodeDiagnostics(*items);
    if (!entries)
    {
        return entries.takeError();
    }

    DiagnosticStamp stamp;
    stamp.sequence = diagnostics_.nextSequence();
    if (const auto snapshot = documents_.lookup(*uri))
    {
        stamp.documentVersion = snapshot->version;
    }
    diagnostics_.update(*uri, *entries, stamp);

    DiagnosticSet set;
    set.uri         = *uri;
    set.diagnostics = std::move(*entries);
    set.stamp       = stamp;
    return set;
}

llvm::Error Client::openFile(llvm::StringRef path)
{
    if (auto error = requireReady())
    {
        return error;
    }
    auto uri = syncDocument(path);
    if (!uri)
    {
        return uri.takeError();
    }
    return llvm::Error::success();
}

llvm::Error Client::closeFile(llvm::StringRef path)
{
    if (auto error = requireReady())
    {
        return error;
    }
    const std::string uri = pathToUri(path);
    if (auto error = documents_.close(uri))
    {
        return error;
    }
    diagnostics_.erase(uri);
    return llvm::Error::success();
}

DiagnosticSet Client::diagnostics(llvm::StringRef path) const
{
    return diagnostics_.snapshot(pathToUri(path));
}

llvm::Expected<DiagnosticSet> Client::waitForDiagnostics(llvm::StringRef                                path,
                                                         const std::optional<std::chrono::milliseconds> timeout)
{
    if (auto error = requireReady())
    {
        return std::move(error);
    }
    const std::string   expectedUri = pathToUri(path);
    const std::uint64_t seen        = diagnostics_.currentSequence(expectedUri);
    auto                uri         = syncDocument(path);
    if (!uri)
    {
        return uri.takeError();
    }
    if (!diagnostics_.waitForUpdate(*uri, seen, timeout ? *timeout : config_.diagnosticsWait))
    {
        logger_.verbose(Component, "no new diagnostics for " + *uri + " before the wait elapsed");
    }
    return diagnostics_.snapshot(*uri);
}

llvm::Expected<llvm::json::Value> Client::sendRequest(llvm::StringRef       method,
                                                      llvm::json::Value     params,
                                                      const RequestOptions& options)
{
    if (auto error = requireReady())
    {
        return std::move(error);
    }
    return call(method, std::move(params), timeoutFor(options), options.cancellation);
}

llvm::Error Client::sendNotification(llvm::StringRef method, llvm::json::Value params)
{
    if (auto error = requireReady())
    {
        return error;
    }
    return notify(method, std::move(params));
}

}  // namespace lspbridge::lsp
