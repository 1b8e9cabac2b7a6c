//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the inbound message queue and its consumer thread.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/NotificationDispatcher.h"

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/Protocol.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral Component = "dispatcher";

/// Converts a handler failure into a JSON-RPC error code and message.
std::pair<int, std::string> replyErrorFor(llvm::Error error)
{
    int         code = rpc_errors::InternalError;
    std::string message;
    llvm::handleAllErrors(
        std::move(error),
        [&](const ClientError& clientError) {
            if (clientError.kind() == ErrorKind::ProtocolError && clientError.code() != 0)
            {
                code = static_cast<int>(clientError.code());
            }
            else if (clientError.kind() == ErrorKind::InvalidArgument)
            {
                code = rpc_errors::InvalidParams;
            }
            message = clientError.message();
        },
        [&](const llvm::ErrorInfoBase& other) { message = other.message(); });
    return {code, std::move(message)};
}

}  // namespace

class NotificationDispatcher::Impl final
{
public:
    struct Item final
    {
        bool              isFrameError{false};
        llvm::json::Value message{nullptr};
        std::string       error;
    };

    explicit Impl(Logger& logger)
        : logger_(logger)
        , worker_([this]() { run(); })
    {
    }

    ~Impl()
    {
        shutdown();
    }

    void onNotification(std::string method, NotificationHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        notificationHandlers_[std::move(method)] = std::move(handler);
    }

    void onRequest(std::string method, ServerRequestHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requestHandlers_[std::move(method)] = std::move(handler);
    }

    void onFrameError(FrameErrorHandler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        frameErrorHandler_ = std::move(handler);
    }

    void setReplySender(ReplySender sender)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        replySender_ = std::move(sender);
    }

    bool enqueue(Item item)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_)
        {
            return false;
        }
        queue_.push_back(std::move(item));
        cv_.notify_all();
        return true;
    }

    void drain()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        idleCv_.wait(lock, [this]() { return stopping_ || (queue_.empty() && !busy_); });
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
            queue_.clear();
        }
        cv_.notify_all();
        idleCv_.notify_all();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    std::uint64_t dispatchedCount() const
    {
        return dispatched_.load(std::memory_order_relaxed);
    }

    std::uint64_t frameErrorCount() const
    {
        return frameErrors_.load(std::memory_order_relaxed);
    }

private:
    void run()
    {
        while (true)
        {
            Item item;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (stopping_)
                {
                    return;
                }
                item = std::move(queue_.front());
                queue_.pop_front();
                busy_ = true;
            }

            if (item.isFrameError)
            {
                handleFrameError(item.error);
            }
            else
            {
                handleMessage(item.message);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                busy_ = false;
            }
            idleCv_.notify_all();
        }
    }

    void handleFrameError(const std::string& error)
    {
        frameErrors_.fetch_add(1, std::memory_order_relaxed);
        FrameErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = frameErrorHandler_;
        }
        if (handler)
        {
            handler(error);
        }
    }

    void handleMessage(const llvm::json::Value& message)
    {
        const auto* object = message.getAsObject();
        if (!object)
        {
            return;
        }
        const auto method = object->getString("method");
        if (!method)
        {
            return;
        }
        const llvm::json::Value  nullParams(nullptr);
        const llvm::json::Value* params = object->get("params");
        if (!params)
        {
            params = &nullParams;
        }

        if (classifyMessage(message) == MessageKind::Notification)
        {
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto                  it = notificationHandlers_.find(method->str());
                if (it != notificationHandlers_.end())
                {
                    handler = it->second;
                }
            }
            if (handler)
            {
                handler(*params);
            }
            else
            {
                logger_.verbose(Component, "ignoring notification '" + method->str() + "'");
            }
            dispatched_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        ServerRequestHandler handler;
        ReplySender          sender;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto                  it = requestHandlers_.find(method->str());
            if (it != requestHandlers_.end())
            {
                handler = it->second;
            }
            sender = replySender_;
        }

        const llvm::json::Value id = cloneJsonId(*object->get("id"));
        llvm::json::Value       reply(nullptr);
        if (!handler)
        {
            logger_.basic(Component, "no handler for server request '" + method->str() + "'");
            reply = makeErrorResponse(id, rpc_errors::MethodNotFound, "method not supported: " + method->str());
        }
        else if (auto result = handler(*params))
        {
            reply = makeResultResponse(id, std::move(*result));
        }
        else
        {
            auto [code, text] = replyErrorFor(result.takeError());
            reply             = makeErrorResponse(id, code, text);
        }
        dispatched_.fetch_add(1, std::memory_order_relaxed);

        if (!sender)
        {
            logger_.basic(Component, "dropping reply to '" + method->str() + "': no reply path");
            return;
        }
        if (auto error = sender(std::move(reply)))
        {
            logger_.basic(Component,
                          "failed to reply to '" + method->str() + "': " + llvm::toString(std::move(error)));
        }
    }

    Logger&                                               logger_;
    mutable std::mutex                                    mutex_;
    std::condition_variable                               cv_;
    std::condition_variable                               idleCv_;
    std::deque<Item>                                      queue_;
    std::unordered_map<std::string, NotificationHandler>  notificationHandlers_;
    std::unordered_map<std::string, ServerRequestHandler> requestHandlers_;
    FrameErrorHandler                                     frameErrorHandler_;
    ReplySender                                           replySender_;
    bool                                                  busy_{false};
    bool                                                  stopping_{false};
    std::atomic<std::uint64_t>                            dispatched_{0};
    std::atomic<std::uint64_t>                            frameErrors_{0};
    std::thread                                           worker_;
};

NotificationDispatcher::NotificationDispatcher(Logger& logger)
    : impl_(std::make_unique<Impl>(logger))
{
}

NotificationDispatcher::~NotificationDispatcher() = default;

void NotificationDispatcher::onNotification(std::string method, NotificationHandler handler)
{
    impl_->onNotification(std::move(method), std::move(handler));
}

void NotificationDispatcher::onRequest(std::string method, ServerRequestHandler handler)
{
    impl_->onRequest(std::move(method), std::move(handler));
}

void NotificationDispatcher::onFrameError(FrameErrorHandler handler)
{
    impl_->onFrameError(std::move(handler));
}

void NotificationDispatcher::setReplySender(ReplySender sender)
{
    impl_->setReplySender(std::move(sender));
}

bool NotificationDispatcher::enqueue(llvm::json::Value message)
{
    Impl::Item item;
    item.message = std::move(message);
    return impl_->enqueue(std::move(item));
}

void NotificationDispatcher::reportFrameError(std::string error)
{
    Impl::Item item;
    item.isFrameError = true;
    item.error        = std::move(error);
    static_cast<void>(impl_->enqueue(std::move(item)));
}

void NotificationDispatcher::drain()
{
    impl_->drain();
}

void NotificationDispatcher::shutdown()
{
    impl_->shutdown();
}

std::uint64_t NotificationDispatcher::dispatchedCount() const
{
    return impl_->dispatchedCount();
}

std::uint64_t NotificationDispatcher::frameErrorCount() const
{
    return impl_->frameErrorCount();
}

}  // namespace lspbridge::lsp
