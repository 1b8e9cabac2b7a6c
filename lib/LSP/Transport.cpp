//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the receive loop and serialized send path.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/Transport.h"

#include "lspbridge/LSP/ClientError.h"
#include "lspbridge/LSP/FdStream.h"
#include "lspbridge/LSP/Protocol.h"

#include "llvm/Support/FormatVariadic.h"

#include <utility>

namespace lspbridge::lsp
{
namespace
{

constexpr llvm::StringLiteral Component = "transport";

std::string describeForTrace(const llvm::json::Value& message)
{
    const auto* object = message.getAsObject();
    if (!object)
    {
        return "<non-object>";
    }
    std::string text;
    if (const auto method = object->getString("method"))
    {
        text += method->str();
    }
    if (const auto* id = object->get("id"))
    {
        text += llvm::formatv(" id={0}", *id).str();
    }
    if (object->get("error"))
    {
        text += " (error)";
    }
    return text;
}

}  // namespace

Transport::Transport(std::istream& in, std::ostream& out, Logger& logger)
    : framing_(in, out)
    , logger_(logger)
{
    ignoreBrokenPipeSignal();
}

Transport::~Transport()
{
    join();
}

void Transport::setHandlers(Handlers handlers)
{
    handlers_ = std::move(handlers);
}

void Transport::start()
{
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (receiver_.joinable())
    {
        return;
    }
    receiver_ = std::thread([this]() { receiveLoop(); });
}

void Transport::join()
{
    std::lock_guard<std::mutex> lock(joinMutex_);
    if (receiver_.joinable() && receiver_.get_id() != std::this_thread::get_id())
    {
        receiver_.join();
    }
}

void Transport::receiveLoop()
{
    while (true)
    {
        llvm::json::Value message(nullptr);
        std::string       error;
        const ReadStatus  status = framing_.readMessage(message, error);
        if (status == ReadStatus::EndOfStream)
        {
            markClosed(error.empty() ? std::string("server closed the stream") : error);
            return;
        }
        if (status == ReadStatus::MalformedFrame)
        {
            malformedFrames_.fetch_add(1, std::memory_order_relaxed);
            logger_.basic(Component, "skipping malformed frame: " + error);
            if (handlers_.onFrameError)
            {
                handlers_.onFrameError(std::move(error));
            }
            continue;
        }

        framesReceived_.fetch_add(1, std::memory_order_relaxed);
        if (logger_.enabled(TraceLevel::Verbose))
        {
            logger_.verbose(Component, "<-- " + describeForTrace(message));
        }

        switch (classifyMessage(message))
        {
        case MessageKind::Response:
            if (handlers_.onResponse)
            {
                handlers_.onResponse(std::move(message));
            }
            break;
        case MessageKind::Request:
        case MessageKind::Notification:
            if (handlers_.onInbound)
            {
                handlers_.onInbound(std::move(message));
            }
            break;
        case MessageKind::Invalid:
            malformedFrames_.fetch_add(1, std::memory_order_relaxed);
            if (handlers_.onFrameError)
            {
                handlers_.onFrameError("payload is not a JSON-RPC request, response or notification");
            }
            break;
        }
    }
}

llvm::Error Transport::send(const llvm::json::Value& message)
{
    if (isClosed())
    {
        return makeClientError(ErrorKind::TransportFault, "transport is closed");
    }
    if (framing_.isOutputClosed())
    {
        return makeClientError(ErrorKind::TransportFault, "server input is closed");
    }
    if (logger_.enabled(TraceLevel::Verbose))
    {
        logger_.verbose(Component, "--> " + describeForTrace(message));
    }
    if (!framing_.writeMessage(message))
    {
        if (framing_.isOutputClosed())
        {
            return makeClientError(ErrorKind::TransportFault, "server input is closed");
        }
        markClosed("write to server failed");
        return makeClientError(ErrorKind::TransportFault, "write to server failed");
    }
    return llvm::Error::success();
}

void Transport::closeOutput(const std::function<void()>& closer)
{
    framing_.closeOutput(closer);
}

void Transport::markClosed(std::string reason)
{
    if (closed_.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    logger_.basic(Component, "transport closed: " + reason);
    if (handlers_.onClosed)
    {
        handlers_.onClosed(std::move(reason));
    }
}

}  // namespace lspbridge::lsp
