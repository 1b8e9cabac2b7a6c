//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements descriptor-backed stream buffers.
///
//===----------------------------------------------------------------------===//

#include "lspbridge/LSP/FdStream.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <csignal>
#include <mutex>

#include <poll.h>
#include <unistd.h>

namespace lspbridge::lsp
{

FdInputBuffer::FdInputBuffer(const int fd, const bool owned)
    : fd_(fd)
    , owned_(owned)
{
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

FdInputBuffer::~FdInputBuffer()
{
    if (owned_ && fd_ >= 0)
    {
        ::close(fd_);
    }
}

FdInputBuffer::int_type FdInputBuffer::underflow()
{
    if (gptr() < egptr())
    {
        return traits_type::to_int_type(*gptr());
    }
    if (fd_ < 0)
    {
        return traits_type::eof();
    }

    ssize_t count = 0;
    do
    {
        count = ::read(fd_, buffer_.data(), buffer_.size());
    } while (count < 0 && errno == EINTR);

    if (count <= 0)
    {
        return traits_type::eof();
    }
    setg(buffer_.data(), buffer_.data(), buffer_.data() + count);
    return traits_type::to_int_type(*gptr());
}

FdOutputBuffer::FdOutputBuffer(const int fd, const bool owned)
    : fd_(fd)
    , owned_(owned)
{
    setp(buffer_.data(), buffer_.data() + buffer_.size());
}

FdOutputBuffer::~FdOutputBuffer()
{
    close();
}

void FdOutputBuffer::close()
{
    if (fd_ < 0)
    {
        return;
    }
    // Pending bytes are best-effort once the owner is closing the stream.
    static_cast<void>(flushBuffer());
    if (owned_)
    {
        ::close(fd_);
    }
    fd_ = -1;
}

FdOutputBuffer::int_type FdOutputBuffer::overflow(const int_type ch)
{
    if (!flushBuffer())
    {
        return traits_type::eof();
    }
    if (!traits_type::eq_int_type(ch, traits_type::eof()))
    {
        *pptr() = traits_type::to_char_type(ch);
        pbump(1);
    }
    return traits_type::not_eof(ch);
}

int FdOutputBuffer::sync()
{
    return flushBuffer() ? 0 : -1;
}

void FdOutputBuffer::setWriteTimeout(const std::chrono::milliseconds timeout)
{
    writeTimeoutMs_.store(std::max<std::int64_t>(timeout.count(), 0), std::memory_order_relaxed);
}

bool FdOutputBuffer::waitWritable() const
{
    const std::int64_t timeoutMs = writeTimeoutMs_.load(std::memory_order_relaxed);
    if (timeoutMs == 0)
    {
        return true;
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (true)
    {
        const auto left =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
        {
            return false;
        }
        pollfd descriptor{};
        descriptor.fd     = fd_;
        descriptor.events = POLLOUT;
        const int ready   = ::poll(&descriptor, 1, static_cast<int>(std::min<std::int64_t>(left.count(), INT_MAX)));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (ready == 0)
        {
            return false;
        }
        // POLLERR and POLLHUP are reported by the write itself.
        return true;
    }
}

bool FdOutputBuffer::flushBuffer()
{
    const char* cursor    = pbase();
    std::size_t remaining = static_cast<std::size_t>(pptr() - pbase());
    setp(buffer_.data(), buffer_.data() + buffer_.size());
    if (remaining == 0U)
    {
        return true;
    }
    if (fd_ < 0)
    {
        return false;
    }
    const bool bounded = writeTimeoutMs_.load(std::memory_order_relaxed) != 0;
    while (remaining > 0U)
    {
        if (!waitWritable())
        {
            return false;
        }
        // A writable descriptor takes PIPE_BUF bytes without blocking.
        const std::size_t chunk   = bounded ? std::min<std::size_t>(remaining, PIPE_BUF) : remaining;
        const ssize_t     written = ::write(fd_, cursor, chunk);
        if (written < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

FdInputStream::FdInputStream(const int fd, const bool owned)
    : std::istream(nullptr)
    , buffer_(fd, owned)
{
    rdbuf(&buffer_);
}

FdOutputStream::FdOutputStream(const int fd, const bool owned)
    : std::ostream(nullptr)
    , buffer_(fd, owned)
{
    rdbuf(&buffer_);
}

void ignoreBrokenPipeSignal()
{
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

}  // namespace lspbridge::lsp
