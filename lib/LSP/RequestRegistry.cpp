//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements pending-call slots, response routing and the deadline watchdog.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/RequestRegistry.h"

#include "lspbridge/LSP/Protocol.h"

#include "llvm/Support/FormatVariadic.h"

#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral Component = "registry";

using Clock = std::chrono::steady_clock;

}  // namespace

CancellationToken::CancellationToken()
    : state_(std::make_shared<std::atomic_bool>(false))
{
}

void CancellationToken::cancel() const
{
    state_->store(true, std::memory_order_relaxed);
}

bool CancellationToken::isCancellationRequested() const
{
    return state_->load(std::memory_order_relaxed);
}

/// Single-assignment outcome cell shared by the registry and the caller.
class PendingCall::Slot final
{
public:
    Slot(std::int64_t id, std::string method)
        : id_(id)
        , method_(std::move(method))
    {
    }

    [[nodiscard]] std::int64_t id() const
    {
        return id_;
    }

    [[nodiscard]] const std::string& method() const
    {
        return method_;
    }

    bool completeWithResult(llvm::json::Value result)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_)
        {
            return false;
        }
        result_ = std::move(result);
        ready_  = true;
        cv_.notify_all();
        return true;
    }

    bool completeWithError(ErrorKind kind, std::string message, std::int64_t code)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ready_)
        {
            return false;
        }
        failed_       = true;
        errorKind_    = kind;
        errorMessage_ = std::move(message);
        errorCode_    = code;
        ready_        = true;
        cv_.notify_all();
        return true;
    }

    [[nodiscard]] bool isReady() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return ready_;
    }

    bool waitFor(std::chrono::milliseconds timeout) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return ready_; });
    }

    llvm::Expected<llvm::json::Value> wait() const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return ready_; });
        if (failed_)
        {
            return makeClientError(errorKind_, errorMessage_, errorCode_);
        }
        return llvm::json::Value(result_);
    }

private:
    const std::int64_t              id_;
    const std::string               method_;
    mutable std::mutex              mutex_;
    mutable std::condition_variable cv_;
    bool                            ready_{false};
    bool                            failed_{false};
    llvm::json::Value               result_{nullptr};
    ErrorKind                       errorKind_{ErrorKind::SessionClosed};
    std::string                     errorMessage_;
    std::int64_t                    errorCode_{0};
};

PendingCall::PendingCall(std::shared_ptr<Slot> slot)
    : slot_(std::move(slot))
{
}

std::int64_t PendingCall::id() const
{
    return slot_ ? slot_->id() : -1;
}

const std::string& PendingCall::method() const
{
    static const std::string empty;
    return slot_ ? slot_->method() : empty;
}

bool PendingCall::isReady() const
{
    return slot_ && slot_->isReady();
}

bool PendingCall::waitFor(const std::chrono::milliseconds timeout) const
{
    return slot_ && slot_->waitFor(timeout);
}

llvm::Expected<llvm::json::Value> PendingCall::wait() const
{
    if (!slot_)
    {
        return makeClientError(ErrorKind::SessionClosed, "call was never registered");
    }
    return slot_->wait();
}

class RequestRegistry::Impl final
{
public:
    Impl(Logger& logger, std::chrono::milliseconds lateRetention)
        : logger_(logger)
        , lateRetention_(lateRetention)
        , watchdog_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
    }

    llvm::Expected<PendingCall> registerCall(std::int64_t                     id,
                                             std::string                      method,
                                             std::optional<Clock::time_point> deadline)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || stopping_)
        {
            return makeClientError(ErrorKind::SessionClosed,
                                   "session is closed; cannot issue '" + method + "'");
        }
        if (calls_.contains(id))
        {
            return makeClientError(ErrorKind::InvalidArgument,
                                   llvm::formatv("request id {0} is already pending", id).str());
        }

        auto slot = std::make_shared<PendingCall::Slot>(id, std::move(method));
        calls_.emplace(id, Entry{slot, deadline});
        lateIds_.erase(id);
        if (deadline)
        {
            cv_.notify_all();
        }
        return PendingCall(std::move(slot));
    }

    FulfillStatus fulfill(std::int64_t id, llvm::json::Value result)
    {
        std::shared_ptr<PendingCall::Slot> slot;
        const FulfillStatus                status = take(id, slot);
        if (status == FulfillStatus::Delivered)
        {
            slot->completeWithResult(std::move(result));
        }
        return status;
    }

    FulfillStatus fulfillError(std::int64_t id, ErrorKind kind, std::string message, std::int64_t code)
    {
        std::shared_ptr<PendingCall::Slot> slot;
        const FulfillStatus                status = take(id, slot);
        if (status == FulfillStatus::Delivered)
        {
            slot->completeWithError(kind, std::move(message), code);
        }
        return status;
    }

    bool cancel(std::int64_t id, ErrorKind kind, std::string reason)
    {
        std::shared_ptr<PendingCall::Slot> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = calls_.find(id);
            if (it == calls_.end())
            {
                return false;
            }
            slot = std::move(it->second.slot);
            calls_.erase(it);
            lateIds_[id] = Clock::now() + lateRetention_;
            cv_.notify_all();
        }
        return slot->completeWithError(kind, std::move(reason), 0);
    }

    std::size_t failAll(const std::string& reason)
    {
        std::vector<std::shared_ptr<PendingCall::Slot>> failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            failed.reserve(calls_.size());
            for (auto& [_, entry] : calls_)
            {
                failed.push_back(std::move(entry.slot));
            }
            calls_.clear();
            lateIds_.clear();
        }
        for (const auto& slot : failed)
        {
            slot->completeWithError(ErrorKind::SessionClosed, reason, 0);
        }
        if (!failed.empty())
        {
            logger_.basic(Component, llvm::formatv("failed {0} pending call(s): {1}", failed.size(), reason).str());
        }
        return failed.size();
    }

    void reopen()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_)
        {
            closed_ = false;
        }
    }

    std::size_t outstanding() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ || stopping_;
    }

    void setTimeoutHandler(TimeoutHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timeoutHandler_ = std::move(handler);
    }

    void shutdown()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_)
            {
                return;
            }
            stopping_ = true;
        }
        failAll("request registry shut down");
        cv_.notify_all();
        if (watchdog_.joinable())
        {
            watchdog_.join();
        }
    }

private:
    struct Entry final
    {
        std::shared_ptr<PendingCall::Slot> slot;
        std::optional<Clock::time_point>   deadline;
    };

    FulfillStatus take(std::int64_t id, std::shared_ptr<PendingCall::Slot>& slot)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto                  it = calls_.find(id);
        if (it != calls_.end())
        {
            slot = std::move(it->second.slot);
            calls_.erase(it);
            return FulfillStatus::Delivered;
        }
        const auto late = lateIds_.find(id);
        if (late != lateIds_.end())
        {
            lateIds_.erase(late);
            return FulfillStatus::Late;
        }
        return FulfillStatus::Unknown;
    }

    void run()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stopping_)
        {
            const auto now = Clock::now();

            std::vector<std::shared_ptr<PendingCall::Slot>> expired;
            std::optional<Clock::time_point>                nextWake;
            for (auto it = calls_.begin(); it != calls_.end();)
            {
                if (it->second.deadline && *it->second.deadline <= now)
                {
                    lateIds_[it->first] = now + lateRetention_;
                    expired.push_back(std::move(it->second.slot));
                    it = calls_.erase(it);
                    continue;
                }
                if (it->second.deadline && (!nextWake || *it->second.deadline < *nextWake))
                {
                    nextWake = it->second.deadline;
                }
                ++it;
            }
            for (auto it = lateIds_.begin(); it != lateIds_.end();)
            {
                if (it->second <= now)
                {
                    it = lateIds_.erase(it);
                    continue;
                }
                if (!nextWake || it->second < *nextWake)
                {
                    nextWake = it->second;
                }
                ++it;
            }

            if (!expired.empty())
            {
                const TimeoutHandler handler = timeoutHandler_;
                lock.unlock();
                for (const auto& slot : expired)
                {
                    const std::string message =
                        llvm::formatv("'{0}' (id {1}) timed out", slot->method(), slot->id()).str();
                    if (slot->completeWithError(ErrorKind::Timeout, message, 0))
                    {
                        logger_.basic(Component, message);
                        if (handler)
                        {
                            handler(slot->id(), slot->method());
                        }
                    }
                }
                lock.lock();
                continue;
            }

            if (nextWake)
            {
                cv_.wait_until(lock, *nextWake);
            }
            else
            {
                cv_.wait(lock);
            }
        }
    }

    Logger&                                                  logger_;
    const std::chrono::milliseconds                          lateRetention_;
    mutable std::mutex                                       mutex_;
    std::condition_variable                                  cv_;
    std::unordered_map<std::int64_t, Entry>                  calls_;
    std::unordered_map<std::int64_t, Clock::time_point>      lateIds_;
    TimeoutHandler                                           timeoutHandler_;
    bool                                                     closed_{false};
    bool                                                     stopping_{false};
    std::thread                                              watchdog_;
};

RequestRegistry::RequestRegistry(Logger& logger, const std::chrono::milliseconds lateRetention)
    : impl_(std::make_unique<Impl>(logger, lateRetention))
{
}

RequestRegistry::~RequestRegistry() = default;

llvm::Expected<PendingCall> RequestRegistry::registerCall(const std::int64_t                                   id,
                                                          std::string                                          method,
                                                          std::optional<std::chrono::steady_clock::time_point> deadline)
{
    return impl_->registerCall(id, std::move(method), deadline);
}

FulfillStatus RequestRegistry::fulfill(const std::int64_t id, llvm::json::Value result)
{
    return impl_->fulfill(id, std::move(result));
}

FulfillStatus RequestRegistry::fulfillError(const std::int64_t id,
                                            const ErrorKind    kind,
                                            std::string        message,
                                            const std::int64_t code)
{
    return impl_->fulfillError(id, kind, std::move(message), code);
}

FulfillStatus RequestRegistry::routeResponse(const llvm::json::Value& response)
{
    const auto id = integerMessageId(response);
    if (!id)
    {
        return FulfillStatus::Unknown;
    }
    const auto* object = response.getAsObject();
    if (const auto* error = object->getObject("error"))
    {
        std::int64_t code = 0;
        if (const auto value = error->getInteger("code"))
        {
            code = *value;
        }
        std::string message = "server returned an error";
        if (const auto value = error->getString("message"))
        {
            message = value->str();
        }
        return impl_->fulfillError(*id, ErrorKind::ProtocolError, std::move(message), code);
    }
    if (const auto* result = object->get("result"))
    {
        return impl_->fulfill(*id, llvm::json::Value(*result));
    }
    return impl_->fulfill(*id, llvm::json::Value(nullptr));
}

bool RequestRegistry::cancel(const std::int64_t id, const ErrorKind kind, std::string reason)
{
    return impl_->cancel(id, kind, std::move(reason));
}

std::size_t RequestRegistry::failAll(const std::string& reason)
{
    return impl_->failAll(reason);
}

void RequestRegistry::reopen()
{
    impl_->reopen();
}

std::size_t RequestRegistry::outstanding() const
{
    return impl_->outstanding();
}

bool RequestRegistry::isClosed() const
{
    return impl_->isClosed();
}

void RequestRegistry::setTimeoutHandler(TimeoutHandler handler)
{
    impl_->setTimeoutHandler(std::move(handler));
}

void RequestRegistry::shutdown()
{
    impl_->shutdown();
}

}  // namespace lspbridge::lsp
