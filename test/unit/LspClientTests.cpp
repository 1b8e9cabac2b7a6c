//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Drives the client against a scripted peer over a socket pair.
///
/// The peer plays the server role with hand-written replies so that ordering,
/// timeouts, cancellation and failure paths can be forced deterministically.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Client.h"
#include "lspbridge/LSP/FdStream.h"
#include "lspbridge/LSP/JsonRpcIO.h"
#include "lspbridge/LSP/Protocol.h"

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace lspbridge::lsp;
using namespace std::chrono_literals;

/// In-memory file contents served through the client's file reader hook.
struct VirtualFiles final
{
    std::mutex                         mutex;
    std::map<std::string, std::string> contents;

    void set(const std::string& path, std::string text)
    {
        std::lock_guard<std::mutex> lock(mutex);
        contents[path] = std::move(text);
    }

    FileReader reader(const std::shared_ptr<VirtualFiles>& self)
    {
        return [self](llvm::StringRef path) -> llvm::Expected<std::string> {
            std::lock_guard<std::mutex> lock(self->mutex);
            const auto                  it = self->contents.find(path.str());
            if (it == self->contents.end())
            {
                return makeClientError(ErrorKind::InvalidArgument, "no such file: " + path.str());
            }
            return it->second;
        };
    }
};

std::string methodOf(const llvm::json::Object& message)
{
    if (const auto method = message.getString("method"))
    {
        return method->str();
    }
    return {};
}

const llvm::json::Object* paramsOf(const llvm::json::Object& message)
{
    return message.getObject("params");
}

std::int64_t integerAt(const llvm::json::Object* object, llvm::StringRef key)
{
    if (!object)
    {
        return -1;
    }
    if (const auto value = object->getInteger(key))
    {
        return *value;
    }
    return -1;
}

std::string stringAt(const llvm::json::Object* object, llvm::StringRef key)
{
    if (!object)
    {
        return {};
    }
    if (const auto value = object->getString(key))
    {
        return value->str();
    }
    return {};
}

llvm::json::Value wireRange(std::int64_t line, std::int64_t character, std::int64_t endLine, std::int64_t endCharacter)
{
    return llvm::json::Object{
        {"start", llvm::json::Object{{"line", line}, {"character", character}}},
        {"end", llvm::json::Object{{"line", endLine}, {"character", endCharacter}}},
    };
}

class ScriptedPeer final
{
public:
    /// Returns `true` when the message was answered; unanswered requests get the defaults.
    using Handler = std::function<bool(ScriptedPeer& peer, const llvm::json::Object& message)>;

    ScriptedPeer(const int fd, Handler handler)
        : fd_(fd)
        , in_(::dup(fd), true)
        , out_(fd, true)
        , framing_(in_, out_)
        , handler_(std::move(handler))
    {
        reader_ = std::thread([this]() { run(); });
    }

    ~ScriptedPeer()
    {
        disconnect();
        if (reader_.joinable())
        {
            reader_.join();
        }
    }

    ScriptedPeer(const ScriptedPeer&)            = delete;
    ScriptedPeer& operator=(const ScriptedPeer&) = delete;

    void send(const llvm::json::Value& message)
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        static_cast<void>(framing_.writeMessage(message));
    }

    void sendRaw(const std::string& bytes)
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out_.flush();
    }

    void reply(const llvm::json::Value& id, llvm::json::Value result)
    {
        send(makeResultResponse(id, std::move(result)));
    }

    /// Drops the connection in both directions, as a crashed server would.
    void disconnect()
    {
        ::shutdown(fd_, SHUT_RDWR);
    }

    /// Returns received messages with `method`; an empty method selects responses.
    std::vector<llvm::json::Value> received(const std::string& method) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<llvm::json::Value> out;
        for (const auto& message : messages_)
        {
            if (methodOf(*message.getAsObject()) == method)
            {
                out.push_back(message);
            }
        }
        return out;
    }

    bool waitForMessages(const std::string& method, const std::size_t count, const std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            std::size_t seen = 0;
            for (const auto& message : messages_)
            {
                seen += methodOf(*message.getAsObject()) == method ? 1U : 0U;
            }
            return seen >= count;
        });
    }

private:
    void run()
    {
        while (true)
        {
            llvm::json::Value message(nullptr);
            std::string       error;
            const ReadStatus  status = framing_.readMessage(message, error);
            if (status == ReadStatus::EndOfStream)
            {
                return;
            }
            if (status == ReadStatus::MalformedFrame || !message.getAsObject())
            {
                continue;
            }
            {
                std::lock_guard<std::mutex> lock(mutex_);
                messages_.push_back(message);
            }
            cv_.notify_all();

            const llvm::json::Object& object = *message.getAsObject();
            if (handler_ && handler_(*this, object))
            {
                continue;
            }
            answerByDefault(object);
        }
    }

    void answerByDefault(const llvm::json::Object& message)
    {
        const llvm::json::Value* id = message.get("id");
        const std::string        method = methodOf(message);
        if (!id || method.empty())
        {
            return;
        }
        if (method == methods::Initialize)
        {
            reply(*id,
                  llvm::json::Object{
                      {"capabilities",
                       llvm::json::Object{{"definitionProvider", true},
                                          {"hoverProvider", true},
                                          {"referencesProvider", true},
                                          {"renameProvider", true}}},
                      {"serverInfo", llvm::json::Object{{"name", "scripted"}, {"version", "0"}}},
                  });
            return;
        }
        if (method == methods::Shutdown)
        {
            reply(*id, nullptr);
            return;
        }
        send(makeErrorResponse(*id, rpc_errors::MethodNotFound, "not scripted: " + method));
    }

    int                             fd_;
    FdInputStream                   in_;
    FdOutputStream                  out_;
    JsonRpcStdioTransport           framing_;
    Handler                         handler_;
    std::mutex                      writeMutex_;
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    std::vector<llvm::json::Value>  messages_;
    std::thread                     reader_;
};

ClientConfig testConfig()
{
    ClientConfig config;
    config.rootPath          = "/virtual";
    config.requestTimeout    = 5s;
    config.initializeTimeout = 5s;
    config.shutdownTimeout   = 1s;
    config.diagnosticsWait   = 2s;
    config.traceLevel        = TraceLevel::Off;
    return config;
}

/// One client attached to one scripted peer over a socket pair.
struct Harness final
{
    explicit Harness(ScriptedPeer::Handler handler, ClientConfig config = testConfig())
        : files(std::make_shared<VirtualFiles>())
    {
        files->set("/virtual/main.cpp", "int main() { return value; }\n");
        ClientHooks hooks;
        hooks.fileReader = files->reader(files);
        hooks.logSink    = [](const LogRecord&) {};
        client           = std::make_unique<Client>(std::move(config), std::move(hooks));

        int fds[2] = {-1, -1};
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0)
        {
            return;
        }
        clientIn  = std::make_unique<FdInputStream>(::dup(fds[0]), true);
        clientOut = std::make_unique<FdOutputStream>(fds[0], true);
        peer      = std::make_unique<ScriptedPeer>(fds[1], std::move(handler));

        const int clientFd = fds[0];
        if (auto error = client->attach(*clientIn, *clientOut, [clientFd]() { ::shutdown(clientFd, SHUT_RDWR); }))
        {
            std::cerr << "attach failed: " << llvm::toString(std::move(error)) << "\n";
            return;
        }
        attached = true;
    }

    ~Harness()
    {
        client.reset();
        peer.reset();
    }

    bool initialize()
    {
        if (!attached)
        {
            return false;
        }
        if (auto error = client->initialize())
        {
            std::cerr << "initialize failed: " << llvm::toString(std::move(error)) << "\n";
            return false;
        }
        return true;
    }

    std::shared_ptr<VirtualFiles>   files;
    std::unique_ptr<FdInputStream>  clientIn;
    std::unique_ptr<FdOutputStream> clientOut;
    std::unique_ptr<ScriptedPeer>   peer;
    std::unique_ptr<Client>         client;
    bool                            attached{false};
};

template <typename T>
std::optional<ErrorKind> kindOf(llvm::Expected<T>& result)
{
    if (result)
    {
        return std::nullopt;
    }
    return consumeErrorKind(result.takeError());
}

bool testHandshakeAndLifecycle()
{
    Harness harness(nullptr);
    auto    early = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (kindOf(early) != ErrorKind::NotReady || harness.client->state() != SessionState::Starting)
    {
        std::cerr << "operations before initialize must fail with NotReady\n";
        return false;
    }
    if (!harness.initialize())
    {
        return false;
    }
    if (harness.client->state() != SessionState::Initialized)
    {
        std::cerr << "client must be initialized after the handshake\n";
        return false;
    }
    const auto  capabilities = harness.client->serverCapabilities();
    const auto* announced    = capabilities.getAsObject();
    if (!announced || announced->getBoolean("definitionProvider") != true)
    {
        std::cerr << "server capabilities were not recorded\n";
        return false;
    }

    if (!harness.peer->waitForMessages(methods::Initialized.str(), 1, 5s))
    {
        std::cerr << "initialized notification was not sent\n";
        return false;
    }
    const auto initializeRequests = harness.peer->received(methods::Initialize.str());
    if (initializeRequests.size() != 1U)
    {
        std::cerr << "exactly one initialize request expected\n";
        return false;
    }
    const auto* params     = paramsOf(*initializeRequests[0].getAsObject());
    const auto* clientInfo = params ? params->getObject("clientInfo") : nullptr;
    const auto* folders    = params ? params->getArray("workspaceFolders") : nullptr;
    if (integerAt(params, "processId") != static_cast<std::int64_t>(::getpid()) ||
        stringAt(clientInfo, "name") != "lspbridge" || stringAt(params, "rootUri") != "file:///virtual" ||
        !folders || folders->size() != 1U || !params->getObject("capabilities"))
    {
        std::cerr << "initialize carried unexpected parameters\n";
        return false;
    }

    if (auto error = harness.client->shutdown())
    {
        std::cerr << "shutdown failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (!harness.peer->waitForMessages(methods::Exit.str(), 1, 5s) ||
        harness.peer->received(methods::Shutdown.str()).size() != 1U)
    {
        std::cerr << "shutdown must send shutdown then exit\n";
        return false;
    }
    if (harness.client->state() != SessionState::Terminated)
    {
        std::cerr << "client must be terminated after shutdown\n";
        return false;
    }
    if (auto error = harness.client->shutdown())
    {
        std::cerr << "a second shutdown must succeed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (harness.peer->received(methods::Shutdown.str()).size() != 1U)
    {
        std::cerr << "a second shutdown must not contact the server\n";
        return false;
    }
    auto late = harness.client->hover("/virtual/main.cpp", 1, 1);
    if (kindOf(late) != ErrorKind::SessionClosed)
    {
        std::cerr << "operations after shutdown must fail with SessionClosed\n";
        return false;
    }
    return true;
}

bool testIdleClientIsNotReady()
{
    ClientHooks hooks;
    hooks.logSink = [](const LogRecord&) {};
    Client client(testConfig(), std::move(hooks));
    auto   result = client.references("/virtual/main.cpp", 1, 1);
    if (kindOf(result) != ErrorKind::NotReady || client.state() != SessionState::Idle)
    {
        std::cerr << "an idle client must reject operations with NotReady\n";
        return false;
    }
    if (auto error = client.shutdown())
    {
        std::cerr << "shutdown of an idle client must succeed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    return true;
}

bool testInitializeFailure()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Initialize)
        {
            return false;
        }
        peer.send(makeErrorResponse(*message.get("id"), rpc_errors::InternalError, "cannot load workspace"));
        return true;
    });
    if (!harness.attached)
    {
        return false;
    }
    auto error = harness.client->initialize();
    if (consumeErrorKind(std::move(error)) != ErrorKind::ProtocolError ||
        harness.client->state() != SessionState::Terminated)
    {
        std::cerr << "a rejected initialize must surface as ProtocolError and end the session\n";
        return false;
    }
    return true;
}

bool testPositionsAndDocumentSync()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        const std::string method = methodOf(message);
        if (method == methods::Definition)
        {
            peer.reply(*message.get("id"),
                       llvm::json::Array{llvm::json::Object{{"uri", "file:///virtual/other.cpp"},
                                                            {"range", wireRange(9, 1, 9, 6)}}});
            return true;
        }
        if (method == methods::Hover)
        {
            peer.reply(*message.get("id"),
                       llvm::json::Object{{"contents", llvm::json::Object{{"kind", "markdown"}, {"value", "**int**"}}}});
            return true;
        }
        return false;
    });
    if (!harness.initialize())
    {
        return false;
    }

    auto locations = harness.client->definition("/virtual/main.cpp", 5, 3);
    if (!locations)
    {
        std::cerr << "definition failed: " << llvm::toString(locations.takeError()) << "\n";
        return false;
    }
    if (locations->size() != 1U || (*locations)[0].path != "/virtual/other.cpp" ||
        (*locations)[0].range.start.line != 10U || (*locations)[0].range.start.column != 2U)
    {
        std::cerr << "definition result must be mapped to one-indexed positions\n";
        return false;
    }

    const auto  definitions = harness.peer->received(methods::Definition.str());
    const auto* params      = definitions.empty() ? nullptr : paramsOf(*definitions[0].getAsObject());
    const auto* position    = params ? params->getObject("position") : nullptr;
    const auto* document    = params ? params->getObject("textDocument") : nullptr;
    if (integerAt(position, "line") != 4 || integerAt(position, "character") != 2 ||
        stringAt(document, "uri") != "file:///virtual/main.cpp")
    {
        std::cerr << "definition request must carry zero-indexed wire positions\n";
        return false;
    }

    auto hover = harness.client->hover("/virtual/main.cpp", 1, 1);
    if (!hover)
    {
        std::cerr << "hover failed: " << llvm::toString(hover.takeError()) << "\n";
        return false;
    }
    if (!*hover || (*hover)->contents != "**int**" || (*hover)->kind != "markdown")
    {
        std::cerr << "hover contents were not decoded\n";
        return false;
    }
    if (harness.peer->received(methods::DidOpen.str()).size() != 1U ||
        !harness.peer->received(methods::DidChange.str()).empty())
    {
        std::cerr << "an unchanged document must be opened exactly once\n";
        return false;
    }

    harness.files->set("/virtual/main.cpp", "int main() { return other; }\n");
    auto again = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (!again)
    {
        std::cerr << "definition after edit failed: " << llvm::toString(again.takeError()) << "\n";
        return false;
    }
    const auto changes = harness.peer->received(methods::DidChange.str());
    if (changes.size() != 1U)
    {
        std::cerr << "edited content must be sent with didChange\n";
        return false;
    }
    const auto* changeDocument = paramsOf(*changes[0].getAsObject())->getObject("textDocument");
    if (integerAt(changeDocument, "version") != 2)
    {
        std::cerr << "didChange must carry the next version\n";
        return false;
    }

    auto invalid = harness.client->definition("/virtual/main.cpp", 0, 1);
    if (kindOf(invalid) != ErrorKind::InvalidArgument ||
        harness.peer->received(methods::Definition.str()).size() != 2U)
    {
        std::cerr << "invalid positions must be rejected before anything is sent\n";
        return false;
    }
    auto missing = harness.client->definition("/virtual/missing.cpp", 1, 1);
    if (kindOf(missing) != ErrorKind::InvalidArgument)
    {
        std::cerr << "unreadable files must be reported\n";
        return false;
    }
    return true;
}

bool testEmptyReferences()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::References)
        {
            return false;
        }
        peer.reply(*message.get("id"), nullptr);
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }
    auto references = harness.client->references("/virtual/main.cpp", 1, 5);
    if (!references)
    {
        std::cerr << "references failed: " << llvm::toString(references.takeError()) << "\n";
        return false;
    }
    if (!references->empty())
    {
        std::cerr << "a null references result must be an empty list\n";
        return false;
    }
    const auto  requests = harness.peer->received(methods::References.str());
    const auto* params   = requests.empty() ? nullptr : paramsOf(*requests[0].getAsObject());
    const auto* context  = params ? params->getObject("context") : nullptr;
    if (!context || context->getBoolean("includeDeclaration") != false)
    {
        std::cerr << "references must exclude the declaration\n";
        return false;
    }
    return true;
}

bool testRenameAcrossFiles()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Rename)
        {
            return false;
        }
        const auto edit = [](std::int64_t line, std::int64_t start, std::int64_t endLine, std::int64_t end) {
            return llvm::json::Object{{"range", wireRange(line, start, endLine, end)}, {"newText", "renamed"}};
        };
        peer.reply(*message.get("id"),
                   llvm::json::Object{{"changes",
                                       llvm::json::Object{
                                           {"file:///virtual/c.cpp", llvm::json::Array{edit(5, 0, 5, 5)}},
                                           {"file:///virtual/a.cpp", llvm::json::Array{edit(2, 4, 2, 9), edit(0, 4, 0, 9)}},
                                           {"file:///virtual/b.cpp", llvm::json::Array{edit(1, 0, 1, 5)}},
                                       }}});
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }

    auto blank = harness.client->rename("/virtual/main.cpp", 1, 5, "  ");
    if (kindOf(blank) != ErrorKind::InvalidArgument)
    {
        std::cerr << "an empty new name must be rejected\n";
        return false;
    }

    auto edits = harness.client->rename("/virtual/main.cpp", 1, 5, "renamed");
    if (!edits)
    {
        std::cerr << "rename failed: " << llvm::toString(edits.takeError()) << "\n";
        return false;
    }
    if (edits->files.size() != 3U || edits->files[0].path != "/virtual/a.cpp" ||
        edits->files[1].path != "/virtual/b.cpp" || edits->files[2].path != "/virtual/c.cpp")
    {
        std::cerr << "rename must return one entry per file ordered by uri\n";
        return false;
    }
    const auto& first = edits->files[0].edits;
    if (first.size() != 2U || first[0].range.start.line != 1U || first[1].range.start.line != 3U ||
        first[0].newText != "renamed")
    {
        std::cerr << "edits within a file must be ordered by position\n";
        return false;
    }

    const auto requests = harness.peer->received(methods::Rename.str());
    if (requests.size() != 1U || stringAt(paramsOf(*requests[0].getAsObject()), "newName") != "renamed")
    {
        std::cerr << "rename must send the new name\n";
        return false;
    }
    return true;
}

bool testTimeoutLeavesSessionUsable()
{
    auto abandoned = std::make_shared<std::atomic<std::int64_t>>(-1);
    Harness harness([abandoned](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Hover)
        {
            return false;
        }
        const auto id = message.getInteger("id");
        if (abandoned->load() < 0 && id)
        {
            abandoned->store(*id);
            return true;
        }
        peer.reply(*message.get("id"), llvm::json::Object{{"contents", "plain text"}});
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }

    RequestOptions options;
    options.timeout = 100ms;
    auto slow       = harness.client->hover("/virtual/main.cpp", 1, 1, options);
    if (kindOf(slow) != ErrorKind::Timeout)
    {
        std::cerr << "an unanswered request must time out\n";
        return false;
    }
    if (!harness.peer->waitForMessages(methods::CancelRequest.str(), 1, 5s))
    {
        std::cerr << "a timed out request must be cancelled on the server\n";
        return false;
    }
    const auto cancels = harness.peer->received(methods::CancelRequest.str());
    if (integerAt(paramsOf(*cancels[0].getAsObject()), "id") != abandoned->load())
    {
        std::cerr << "cancellation must name the timed out request\n";
        return false;
    }

    // The late answer is dropped and does not disturb the next request.
    harness.peer->reply(llvm::json::Value(abandoned->load()), llvm::json::Object{{"contents", "late"}});
    auto next = harness.client->hover("/virtual/main.cpp", 1, 1);
    if (!next)
    {
        std::cerr << "request after a timeout failed: " << llvm::toString(next.takeError()) << "\n";
        return false;
    }
    if (!*next || (*next)->contents != "plain text")
    {
        std::cerr << "request after a timeout received the wrong response\n";
        return false;
    }
    if (harness.client->state() != SessionState::Initialized ||
        harness.client->telemetry().outcomeCount(RequestOutcome::TimedOut) != 1U)
    {
        std::cerr << "a timeout must not end the session\n";
        return false;
    }
    return true;
}

bool testCancellation()
{
    Harness harness([](ScriptedPeer&, const llvm::json::Object& message) {
        return methodOf(message) == methods::Hover;
    });
    if (!harness.initialize())
    {
        return false;
    }

    CancellationToken token;
    RequestOptions    options;
    options.cancellation = token;
    std::thread canceller([token]() {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });
    auto result = harness.client->hover("/virtual/main.cpp", 2, 1, options);
    canceller.join();
    if (kindOf(result) != ErrorKind::Cancelled)
    {
        std::cerr << "a cancelled request must fail with Cancelled\n";
        return false;
    }
    if (!harness.peer->waitForMessages(methods::CancelRequest.str(), 1, 5s))
    {
        std::cerr << "cancellation must be forwarded with $/cancelRequest\n";
        return false;
    }
    const auto hovers  = harness.peer->received(methods::Hover.str());
    const auto cancels = harness.peer->received(methods::CancelRequest.str());
    if (hovers.empty() ||
        integerAt(paramsOf(*cancels[0].getAsObject()), "id") != integerAt(hovers[0].getAsObject(), "id"))
    {
        std::cerr << "$/cancelRequest must name the cancelled request\n";
        return false;
    }
    if (harness.client->telemetry().outcomeCount(RequestOutcome::Cancelled) != 1U)
    {
        std::cerr << "cancelled requests must be recorded\n";
        return false;
    }
    return true;
}

bool testPeerDeathFailsPendingRequest()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Definition)
        {
            return false;
        }
        peer.disconnect();
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }
    auto result = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (kindOf(result) != ErrorKind::SessionClosed)
    {
        std::cerr << "a request pending when the server dies must fail with SessionClosed\n";
        return false;
    }
    if (harness.client->state() != SessionState::Terminated)
    {
        std::cerr << "the session must be terminated after the server dies\n";
        return false;
    }
    auto after = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (kindOf(after) != ErrorKind::SessionClosed)
    {
        std::cerr << "requests after the server died must fail with SessionClosed\n";
        return false;
    }
    if (auto error = harness.client->shutdown())
    {
        std::cerr << "shutdown after server death must succeed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    return true;
}

bool testServerRequestsAreAnswered()
{
    Harness harness(nullptr);
    if (!harness.initialize())
    {
        return false;
    }

    harness.peer->send(makeRequest(100,
                                   methods::Configuration,
                                   llvm::json::Object{{"items",
                                                       llvm::json::Array{llvm::json::Object{{"section", "a"}},
                                                                         llvm::json::Object{{"section", "b"}}}}}));
    harness.peer->send(makeNotification(methods::Progress, llvm::json::Object{{"token", 1}}));
    harness.peer->send(makeRequest(101, "custom/unsupported", nullptr));
    harness.peer->send(makeRequest(102, methods::WorkDoneProgressCreate, llvm::json::Object{{"token", 1}}));
    if (!harness.peer->waitForMessages("", 3, 5s))
    {
        std::cerr << "every server request must be answered\n";
        return false;
    }

    std::map<std::int64_t, llvm::json::Value> replies;
    for (const auto& response : harness.peer->received(""))
    {
        const auto* object = response.getAsObject();
        if (const auto id = object->getInteger("id"))
        {
            replies.emplace(*id, response);
        }
    }
    if (replies.size() != 3U)
    {
        std::cerr << "expected replies for ids 100, 101 and 102\n";
        return false;
    }
    const auto* configuration = replies.at(100).getAsObject()->getArray("result");
    if (!configuration || configuration->size() != 2U || (*configuration)[0].kind() != llvm::json::Value::Null)
    {
        std::cerr << "configuration requests must be answered with one null per item\n";
        return false;
    }
    const auto* error = replies.at(101).getAsObject()->getObject("error");
    if (integerAt(error, "code") != rpc_errors::MethodNotFound)
    {
        std::cerr << "unknown server requests must be answered with MethodNotFound\n";
        return false;
    }
    const auto* created = replies.at(102).getAsObject();
    if (!created->get("result") || created->get("error"))
    {
        std::cerr << "workDoneProgress/create must be acknowledged\n";
        return false;
    }
    return true;
}

bool testDiagnosticsPushAndWait()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::DidOpen)
        {
            return false;
        }
        const auto* document = paramsOf(message)->getObject("textDocument");
        peer.send(makeNotification(
            methods::PublishDiagnostics,
            llvm::json::Object{
                {"uri", stringAt(document, "uri")},
                {"version", integerAt(document, "version")},
                {"diagnostics",
                 llvm::json::Array{llvm::json::Object{{"range", wireRange(2, 4, 2, 9)},
                                                      {"severity", 1},
                                                      {"code", 17},
                                                      {"source", "scripted"},
                                                      {"message", "unused variable"}}}},
            }));
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }

    auto set = harness.client->waitForDiagnostics("/virtual/main.cpp", 5s);
    if (!set)
    {
        std::cerr << "waitForDiagnostics failed: " << llvm::toString(set.takeError()) << "\n";
        return false;
    }
    if (set->diagnostics.size() != 1U || set->diagnostics[0].message != "unused variable" ||
        set->diagnostics[0].severity != DiagnosticSeverity::Error || set->diagnostics[0].range.start.line != 3U ||
        set->diagnostics[0].range.start.column != 5U || set->diagnostics[0].code != std::optional<std::string>("17"))
    {
        std::cerr << "published diagnostics were not decoded\n";
        return false;
    }

    // An older version arrives late and is ignored.
    harness.peer->send(makeNotification(
        methods::PublishDiagnostics,
        llvm::json::Object{{"uri", "file:///virtual/main.cpp"}, {"version", 0}, {"diagnostics", llvm::json::Array{}}}));
    harness.peer->send(makeNotification(
        methods::PublishDiagnostics,
        llvm::json::Object{
            {"uri", "file:///virtual/other.cpp"},
            {"diagnostics",
             llvm::json::Array{llvm::json::Object{{"range", wireRange(0, 0, 0, 1)}, {"message", "other"}}}}}));

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (harness.client->diagnostics("/virtual/other.cpp").diagnostics.empty() &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(5ms);
    }
    if (harness.client->diagnostics("/virtual/other.cpp").diagnostics.size() != 1U)
    {
        std::cerr << "diagnostics for other documents must be cached\n";
        return false;
    }
    if (harness.client->diagnostics("/virtual/main.cpp").diagnostics.size() != 1U)
    {
        std::cerr << "a stale diagnostics push must not replace newer diagnostics\n";
        return false;
    }
    return true;
}

bool testMalformedFrameIsSkipped()
{
    Harness harness([](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Definition)
        {
            return false;
        }
        peer.sendRaw("Content-Length: 5\r\n\r\n{bad}");
        peer.sendRaw("Garbage: yes\r\n\r\n");
        peer.reply(*message.get("id"), llvm::json::Array{});
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }
    auto result = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (!result)
    {
        std::cerr << "malformed frames must not break the session: " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    if (harness.client->state() != SessionState::Initialized)
    {
        std::cerr << "the session must stay initialized after malformed frames\n";
        return false;
    }
    return true;
}

bool testConcurrentRequestsOutOfOrder()
{
    constexpr std::size_t Callers = 8;

    struct Held final
    {
        llvm::json::Value id{nullptr};
        std::int64_t      line{0};
        std::string       uri;
    };
    auto held = std::make_shared<std::vector<Held>>();

    Harness harness([held](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Definition)
        {
            return false;
        }
        const auto* params = paramsOf(message);
        held->push_back(Held{*message.get("id"),
                             integerAt(params->getObject("position"), "line"),
                             stringAt(params->getObject("textDocument"), "uri")});
        if (held->size() < Callers)
        {
            return true;
        }
        // Answer in reverse arrival order.
        for (auto it = held->rbegin(); it != held->rend(); ++it)
        {
            peer.reply(it->id,
                       llvm::json::Array{llvm::json::Object{{"uri", it->uri},
                                                            {"range", wireRange(it->line, 0, it->line, 1)}}});
        }
        return true;
    });
    if (!harness.initialize())
    {
        return false;
    }

    std::atomic<int>         mismatches{0};
    std::vector<std::thread> callers;
    for (std::size_t caller = 0; caller < Callers; ++caller)
    {
        callers.emplace_back([&harness, &mismatches, caller]() {
            const auto line   = static_cast<std::int64_t>(caller) + 1;
            auto       result = harness.client->definition("/virtual/main.cpp", line, 1);
            if (!result)
            {
                llvm::consumeError(result.takeError());
                mismatches.fetch_add(1);
                return;
            }
            if (result->size() != 1U || (*result)[0].range.start.line != static_cast<std::uint32_t>(line))
            {
                mismatches.fetch_add(1);
            }
        });
    }
    for (auto& caller : callers)
    {
        caller.join();
    }
    if (mismatches.load() != 0)
    {
        std::cerr << mismatches.load() << " concurrent requests received the wrong response\n";
        return false;
    }
    if (harness.peer->received(methods::DidOpen.str()).size() != 1U)
    {
        std::cerr << "concurrent requests must open the document once\n";
        return false;
    }
    return true;
}

/// Polls until the first cached diagnostic for `path` carries `message`.
bool waitForDiagnosticMessage(Client& client, const std::string& path, const std::string& message)
{
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline)
    {
        const DiagnosticSet set = client.diagnostics(path);
        if (!set.diagnostics.empty() && set.diagnostics[0].message == message)
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return false;
}

llvm::json::Value diagnosticsPush(const std::string& uri, std::optional<std::int64_t> version, const std::string& message)
{
    llvm::json::Object params{
        {"uri", uri},
        {"diagnostics",
         llvm::json::Array{llvm::json::Object{{"range", wireRange(0, 0, 0, 1)}, {"message", message}}}},
    };
    if (version)
    {
        params["version"] = *version;
    }
    return makeNotification(methods::PublishDiagnostics, std::move(params));
}

bool testNewSessionReopensDocuments()
{
    auto openedFirst = std::make_shared<std::atomic<bool>>(false);

    std::unique_ptr<FdInputStream>  nextIn;
    std::unique_ptr<FdOutputStream> nextOut;
    std::unique_ptr<ScriptedPeer>   nextPeer;
    Harness                         harness(nullptr);
    if (!harness.initialize())
    {
        return false;
    }
    if (auto error = harness.client->openFile("/virtual/main.cpp"))
    {
        std::cerr << "openFile failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    harness.peer->send(diagnosticsPush("file:///virtual/main.cpp", std::nullopt, "from the first server"));
    if (!waitForDiagnosticMessage(*harness.client, "/virtual/main.cpp", "from the first server"))
    {
        std::cerr << "diagnostics from the first server were not cached\n";
        return false;
    }

    harness.peer->disconnect();
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (harness.client->state() != SessionState::Terminated && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(5ms);
    }
    if (harness.client->state() != SessionState::Terminated)
    {
        std::cerr << "the session must end when the server goes away\n";
        return false;
    }

    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0)
    {
        std::cerr << "socketpair failed\n";
        return false;
    }
    nextIn   = std::make_unique<FdInputStream>(::dup(fds[0]), true);
    nextOut  = std::make_unique<FdOutputStream>(fds[0], true);
    nextPeer = std::make_unique<ScriptedPeer>(fds[1], [openedFirst](ScriptedPeer& peer, const llvm::json::Object& message) {
        if (methodOf(message) != methods::Definition)
        {
            return false;
        }
        openedFirst->store(!peer.received(methods::DidOpen.str()).empty());
        peer.reply(*message.get("id"), llvm::json::Array{});
        return true;
    });

    const int clientFd = fds[0];
    if (auto error = harness.client->attach(*nextIn, *nextOut, [clientFd]() { ::shutdown(clientFd, SHUT_RDWR); }))
    {
        std::cerr << "attach after the server went away failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (auto error = harness.client->initialize())
    {
        std::cerr << "initialize of the new session failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (!harness.client->diagnostics("/virtual/main.cpp").diagnostics.empty())
    {
        std::cerr << "diagnostics from the previous server must not survive into a new session\n";
        return false;
    }

    auto result = harness.client->definition("/virtual/main.cpp", 1, 1);
    if (!result)
    {
        std::cerr << "definition on the new session failed: " << llvm::toString(result.takeError()) << "\n";
        return false;
    }
    if (!openedFirst->load())
    {
        std::cerr << "the new server must receive didOpen before any position request\n";
        return false;
    }
    const auto opens    = nextPeer->received(methods::DidOpen.str());
    const auto* document = opens.size() == 1U ? paramsOf(*opens[0].getAsObject())->getObject("textDocument") : nullptr;
    if (integerAt(document, "version") != 1 || stringAt(document, "uri") != "file:///virtual/main.cpp")
    {
        std::cerr << "tracked documents must be reopened once at version 1\n";
        return false;
    }
    return true;
}

bool testReopenedDocumentAcceptsFreshDiagnostics()
{
    Harness harness(nullptr);
    if (!harness.initialize())
    {
        return false;
    }
    const std::string path = "/virtual/main.cpp";
    const std::string uri  = "file:///virtual/main.cpp";
    if (auto error = harness.client->openFile(path))
    {
        std::cerr << "openFile failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    for (const char* text : {"int main() { return 1; }\n", "int main() { return 2; }\n"})
    {
        harness.files->set(path, text);
        if (auto error = harness.client->openFile(path))
        {
            std::cerr << "openFile after edit failed: " << llvm::toString(std::move(error)) << "\n";
            return false;
        }
    }
    harness.peer->send(diagnosticsPush(uri, 3, "third revision"));
    if (!waitForDiagnosticMessage(*harness.client, path, "third revision") ||
        harness.client->diagnostics(path).stamp.documentVersion != std::optional<std::int64_t>(3))
    {
        std::cerr << "diagnostics for version 3 were not cached\n";
        return false;
    }

    if (auto error = harness.client->closeFile(path))
    {
        std::cerr << "closeFile failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (!harness.client->diagnostics(path).diagnostics.empty())
    {
        std::cerr << "closing a document must forget its diagnostics\n";
        return false;
    }

    if (auto error = harness.client->openFile(path))
    {
        std::cerr << "reopen failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    const auto opens = harness.peer->received(methods::DidOpen.str());
    const auto* document = opens.size() == 2U ? paramsOf(*opens[1].getAsObject())->getObject("textDocument") : nullptr;
    if (integerAt(document, "version") != 1)
    {
        std::cerr << "a reopened document must start again at version 1\n";
        return false;
    }

    // A push left over from the previous open arrives after the reopen.
    harness.peer->send(diagnosticsPush(uri, 3, "previous open"));
    harness.peer->send(diagnosticsPush(uri, 1, "fresh"));
    if (!waitForDiagnosticMessage(*harness.client, path, "fresh"))
    {
        std::cerr << "a push for the reopened document must replace the cached set, got '"
                  << (harness.client->diagnostics(path).diagnostics.empty()
                          ? std::string()
                          : harness.client->diagnostics(path).diagnostics[0].message)
                  << "'\n";
        return false;
    }
    return true;
}

bool testShutdownIsFinal()
{
    Harness harness(nullptr);
    if (!harness.initialize())
    {
        return false;
    }
    if (auto error = harness.client->shutdown())
    {
        std::cerr << "shutdown failed: " << llvm::toString(std::move(error)) << "\n";
        return false;
    }
    if (consumeErrorKind(harness.client->start()) != ErrorKind::SessionClosed ||
        consumeErrorKind(harness.client->restart()) != ErrorKind::SessionClosed ||
        consumeErrorKind(harness.client->attach(*harness.clientIn, *harness.clientOut, nullptr)) !=
            ErrorKind::SessionClosed)
    {
        std::cerr << "a client that was shut down must refuse new sessions\n";
        return false;
    }
    if (harness.client->state() != SessionState::Terminated)
    {
        std::cerr << "a refused session must leave the client terminated\n";
        return false;
    }
    return true;
}

}  // namespace

bool runLspClientTests()
{
    bool ok = true;
    ok      = testIdleClientIsNotReady() && ok;
    ok      = testHandshakeAndLifecycle() && ok;
    ok      = testInitializeFailure() && ok;
    ok      = testPositionsAndDocumentSync() && ok;
    ok      = testEmptyReferences() && ok;
    ok      = testRenameAcrossFiles() && ok;
    ok      = testTimeoutLeavesSessionUsable() && ok;
    ok      = testCancellation() && ok;
    ok      = testPeerDeathFailsPendingRequest() && ok;
    ok      = testServerRequestsAreAnswered() && ok;
    ok      = testDiagnosticsPushAndWait() && ok;
    ok      = testMalformedFrameIsSkipped() && ok;
    ok      = testConcurrentRequestsOutOfOrder() && ok;
    ok      = testNewSessionReopensDocuments() && ok;
    ok      = testReopenedDocumentAcceptsFreshDiagnostics() && ok;
    ok      = testShutdownIsFinal() && ok;
    return ok;
}
