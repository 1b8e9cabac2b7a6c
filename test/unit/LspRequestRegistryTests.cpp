//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Validates request correlation, timeouts and exactly-once completion.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/Logger.h"
#include "lspbridge/LSP/RequestRegistry.h"
#include "llvm/Support/JSON.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace
{

using namespace lspbridge::lsp;
using namespace std::chrono_literals;

llvm::json::Value responseFor(std::int64_t id, llvm::json::Value result)
{
    return llvm::json::Object{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

bool testRoutingAndExactlyOnce()
{
    Logger          logger(nullptr, TraceLevel::Off);
    RequestRegistry registry(logger, 5s);

    constexpr std::int64_t   CallCount = 64;
    std::vector<PendingCall> calls;
    for (std::int64_t id = 1; id <= CallCount; ++id)
    {
        auto call = registry.registerCall(id, "textDocument/definition", std::nullopt);
        if (!call)
        {
            std::cerr << "registerCall failed: " << llvm::toString(call.takeError()) << "\n";
            return false;
        }
        calls.push_back(*call);
    }
    if (registry.outstanding() != static_cast<std::size_t>(CallCount))
    {
        std::cerr << "every registered call must be outstanding\n";
        return false;
    }

    // Responses arrive in a shuffled order from a different thread.
    std::vector<std::int64_t> order;
    for (std::int64_t id = 1; id <= CallCount; ++id)
    {
        order.push_back(id);
    }
    std::mt19937 rng(0xC0FFEEu);
    std::shuffle(order.begin(), order.end(), rng);
    std::thread responder([&registry, &order]() {
        for (const std::int64_t id : order)
        {
            static_cast<void>(registry.routeResponse(responseFor(id, llvm::json::Value(id * 10))));
        }
    });

    bool ok = true;
    for (const PendingCall& call : calls)
    {
        auto result = call.wait();
        if (!result)
        {
            std::cerr << "call " << call.id() << " failed: " << llvm::toString(result.takeError()) << "\n";
            ok = false;
            continue;
        }
        if (result->getAsInteger() != call.id() * 10)
        {
            std::cerr << "call " << call.id() << " received another call's response\n";
            ok = false;
        }
    }
    responder.join();
    if (!ok)
    {
        return false;
    }

    // A second response for a delivered id has no pending call to complete.
    if (registry.fulfill(1, llvm::json::Value(0)) != FulfillStatus::Unknown || registry.outstanding() != 0U)
    {
        std::cerr << "a delivered call must not be completed twice\n";
        return false;
    }
    return true;
}

bool testErrorsAndDuplicates()
{
    Logger          logger(nullptr, TraceLevel::Off);
    RequestRegistry registry(logger, 5s);

    auto first = registry.registerCall(7, "textDocument/hover", std::nullopt);
    if (!first)
    {
        std::cerr << "registerCall failed: " << llvm::toString(first.takeError()) << "\n";
        return false;
    }
    auto duplicate = registry.registerCall(7, "textDocument/hover", std::nullopt);
    if (duplicate || consumeErrorKind(duplicate.takeError()) != ErrorKind::InvalidArgument)
    {
        std::cerr << "duplicate outstanding ids must be rejected\n";
        return false;
    }

    const llvm::json::Value errorResponse =
        llvm::json::Object{{"jsonrpc", "2.0"},
                           {"id", 7},
                           {"error", llvm::json::Object{{"code", -32601}, {"message", "no hover"}}}};
    if (registry.routeResponse(errorResponse) != FulfillStatus::Delivered)
    {
        std::cerr << "error response was not delivered\n";
        return false;
    }
    auto result = first->wait();
    if (result)
    {
        std::cerr << "error response must fail the call\n";
        return false;
    }
    std::int64_t code = 0;
    ErrorKind    kind = ErrorKind::TransportFault;
    llvm::handleAllErrors(result.takeError(), [&](const ClientError& error) {
        kind = error.kind();
        code = error.code();
    });
    if (kind != ErrorKind::ProtocolError || code != -32601)
    {
        std::cerr << "error responses must surface as ProtocolError with the server code\n";
        return false;
    }

    auto nullResult = registry.registerCall(8, "shutdown", std::nullopt);
    if (!nullResult)
    {
        std::cerr << "registerCall failed: " << llvm::toString(nullResult.takeError()) << "\n";
        return false;
    }
    if (registry.routeResponse(llvm::json::Object{{"jsonrpc", "2.0"}, {"id", 8}, {"result", nullptr}}) !=
        FulfillStatus::Delivered)
    {
        std::cerr << "null result response was not delivered\n";
        return false;
    }
    auto value = nullResult->wait();
    if (!value || value->kind() != llvm::json::Value::Null)
    {
        std::cerr << "a null result is a successful empty result\n";
        return false;
    }

    if (registry.routeResponse(responseFor(999, 1)) != FulfillStatus::Unknown)
    {
        std::cerr << "responses for unknown ids must be reported as unknown\n";
        return false;
    }
    return true;
}

bool testTimeoutAndLateResponse()
{
    Logger          logger(nullptr, TraceLevel::Off);
    RequestRegistry registry(logger, 5s);

    std::mutex                                         mutex;
    std::vector<std::pair<std::int64_t, std::string>> timedOut;
    registry.setTimeoutHandler([&](std::int64_t id, const std::string& method) {
        std::lock_guard<std::mutex> lock(mutex);
        timedOut.emplace_back(id, method);
    });

    const auto started = std::chrono::steady_clock::now();
    auto       slow    = registry.registerCall(11, "textDocument/references", started + 50ms);
    auto       fast    = registry.registerCall(12, "textDocument/definition", started + 10s);
    if (!slow || !fast)
    {
        std::cerr << "registerCall failed\n";
        return false;
    }

    auto slowResult = slow->wait();
    const auto waited = std::chrono::steady_clock::now() - started;
    if (slowResult || consumeErrorKind(slowResult.takeError()) != ErrorKind::Timeout)
    {
        std::cerr << "expired call must fail with Timeout\n";
        return false;
    }
    if (waited > 5s)
    {
        std::cerr << "timeout fired far too late\n";
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        if (timedOut.size() != 1U || timedOut[0].first != 11 || timedOut[0].second != "textDocument/references")
        {
            std::cerr << "timeout handler must run once for the expired call\n";
            return false;
        }
    }

    // The session stays usable: the other call still completes normally.
    if (registry.routeResponse(responseFor(12, "ok")) != FulfillStatus::Delivered)
    {
        std::cerr << "unexpired call could not be completed after a timeout\n";
        return false;
    }
    auto fastResult = fast->wait();
    if (!fastResult)
    {
        std::cerr << "unexpired call failed: " << llvm::toString(fastResult.takeError()) << "\n";
        return false;
    }

    if (registry.routeResponse(responseFor(11, "too late")) != FulfillStatus::Late)
    {
        std::cerr << "a response after timeout must be classified as late\n";
        return false;
    }
    if (registry.routeResponse(responseFor(11, "again")) != FulfillStatus::Unknown)
    {
        std::cerr << "a late id is forgotten after its late response\n";
        return false;
    }
    return true;
}

bool testCancelFailAllAndReopen()
{
    Logger          logger(nullptr, TraceLevel::Off);
    RequestRegistry registry(logger, 5s);

    auto cancelled = registry.registerCall(21, "textDocument/rename", std::nullopt);
    if (!cancelled)
    {
        std::cerr << "registerCall failed\n";
        return false;
    }
    if (!registry.cancel(21, ErrorKind::Cancelled, "caller gave up") ||
        registry.cancel(21, ErrorKind::Cancelled, "twice"))
    {
        std::cerr << "cancel must succeed exactly once\n";
        return false;
    }
    auto cancelledResult = cancelled->wait();
    if (cancelledResult || consumeErrorKind(cancelledResult.takeError()) != ErrorKind::Cancelled)
    {
        std::cerr << "cancelled call must fail with Cancelled\n";
        return false;
    }
    if (registry.routeResponse(responseFor(21, nullptr)) != FulfillStatus::Late)
    {
        std::cerr << "response to a cancelled call must be late\n";
        return false;
    }

    std::vector<PendingCall> pending;
    for (std::int64_t id = 30; id < 35; ++id)
    {
        auto call = registry.registerCall(id, "textDocument/hover", std::nullopt);
        if (!call)
        {
            std::cerr << "registerCall failed\n";
            return false;
        }
        pending.push_back(*call);
    }

    // Waiters blocked on another thread are released by failAll.
    std::atomic<int> sessionClosed{0};
    std::thread      waiter([&]() {
        for (const PendingCall& call : pending)
        {
            auto result = call.wait();
            if (!result && consumeErrorKind(result.takeError()) == ErrorKind::SessionClosed)
            {
                sessionClosed.fetch_add(1);
            }
        }
    });
    std::this_thread::sleep_for(20ms);
    if (registry.failAll("server exited") != pending.size())
    {
        waiter.join();
        std::cerr << "failAll must report every failed call\n";
        return false;
    }
    waiter.join();
    if (sessionClosed.load() != static_cast<int>(pending.size()) || registry.outstanding() != 0U)
    {
        std::cerr << "failAll must complete every pending call with SessionClosed\n";
        return false;
    }

    auto afterClose = registry.registerCall(40, "textDocument/hover", std::nullopt);
    if (afterClose || consumeErrorKind(afterClose.takeError()) != ErrorKind::SessionClosed || !registry.isClosed())
    {
        std::cerr << "a closed registry must refuse new calls\n";
        return false;
    }

    registry.reopen();
    auto reopened = registry.registerCall(41, "textDocument/hover", std::nullopt);
    if (!reopened)
    {
        std::cerr << "reopened registry must accept calls: " << llvm::toString(reopened.takeError()) << "\n";
        return false;
    }

    registry.shutdown();
    auto afterShutdown = reopened->wait();
    if (afterShutdown || consumeErrorKind(afterShutdown.takeError()) != ErrorKind::SessionClosed)
    {
        std::cerr << "shutdown must fail outstanding calls\n";
        return false;
    }
    registry.reopen();
    if (!registry.isClosed())
    {
        std::cerr << "a shut down registry cannot be reopened\n";
        return false;
    }
    return true;
}

bool testCancellationToken()
{
    const CancellationToken token;
    const CancellationToken copy = token;
    if (token.isCancellationRequested())
    {
        std::cerr << "new tokens must not be cancelled\n";
        return false;
    }
    copy.cancel();
    if (!token.isCancellationRequested())
    {
        std::cerr << "token copies must share cancellation state\n";
        return false;
    }
    return true;
}

}  // namespace

bool runLspRequestRegistryTests()
{
    bool ok = true;
    ok      = testRoutingAndExactlyOnce() && ok;
    ok      = testErrorsAndDuplicates() && ok;
    ok      = testTimeoutAndLateResponse() && ok;
    ok      = testCancelFailAllAndReopen() && ok;
    ok      = testCancellationToken() && ok;
    return ok;
}
