//===----------------------------------------------------------------------===//
//
// Part of the OpenCyphal project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Standard stream buffers over POSIX file descriptors.
///
/// Subprocess pipes and socket pairs are exposed as `std::istream` and
/// `std::ostream` so the JSON-RPC framing code can run over them unchanged.
///
//===----------------------------------------------------------------------===//
#ifndef LSPBRIDGE_LSP_FD_STREAM_H
#define LSPBRIDGE_LSP_FD_STREAM_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <istream>
#include <ostream>
#include <streambuf>

namespace lspbridge::lsp
{

/// @brief Read-side stream buffer over a file descriptor.
class FdInputBuffer final : public std::streambuf
{
public:
    /// @brief Wraps a readable descriptor.
    /// @param[in] fd Descriptor to read from.
    /// @param[in] owned Closes `fd` on destruction when `true`.
    FdInputBuffer(int fd, bool owned);
    ~FdInputBuffer() override;

    FdInputBuffer(const FdInputBuffer&)            = delete;
    FdInputBuffer& operator=(const FdInputBuffer&) = delete;

    [[nodiscard]] int fd() const
    {
        return fd_;
    }

protected:
    int_type underflow() override;

private:
    int                    fd_;
    bool                   owned_;
    std::array<char, 8192> buffer_{};
};

/// @brief Write-side stream buffer over a file descriptor.
///
/// Output is buffered until `sync()` (stream flush) and then written in full.
/// With a write timeout set, a flush fails once the descriptor accepts no
/// bytes for that long, and the stream reports the failure as a bad state.
class FdOutputBuffer final : public std::streambuf
{
public:
    /// @brief Wraps a writable descriptor.
    /// @param[in] fd Descriptor to write to.
    /// @param[in] owned Closes `fd` on destruction when `true`.
    FdOutputBuffer(int fd, bool owned);
    ~FdOutputBuffer() override;

    FdOutputBuffer(const FdOutputBuffer&)            = delete;
    FdOutputBuffer& operator=(const FdOutputBuffer&) = delete;

    /// @brief Flushes pending bytes and closes an owned descriptor.
    void close();

    /// @brief Bounds how long a flush may wait for the descriptor to accept more bytes.
    /// @param[in] timeout Longest stall tolerated; zero waits indefinitely.
    void setWriteTimeout(std::chrono::milliseconds timeout);

    [[nodiscard]] int fd() const
    {
        return fd_;
    }

protected:
    int_type overflow(int_type ch) override;
    int      sync() override;

private:
    [[nodiscard]] bool flushBuffer();
    [[nodiscard]] bool waitWritable() const;

    int                       fd_;
    bool                      owned_;
    std::atomic<std::int64_t> writeTimeoutMs_{0};
    std::array<char, 8192>    buffer_{};
};

/// @brief `std::istream` owning an `FdInputBuffer`.
class FdInputStream final : public std::istream
{
public:
    FdInputStream(int fd, bool owned);

    [[nodiscard]] FdInputBuffer& buffer()
    {
        return buffer_;
    }

private:
    FdInputBuffer buffer_;
};

/// @brief `std::ostream` owning an `FdOutputBuffer`.
class FdOutputStream final : public std::ostream
{
public:
    FdOutputStream(int fd, bool owned);

    [[nodiscard]] FdOutputBuffer& buffer()
    {
        return buffer_;
    }

private:
    FdOutputBuffer buffer_;
};

/// @brief Ignores `SIGPIPE` process-wide so writes to a dead peer fail with `EPIPE`.
void ignoreBrokenPipeSignal();

}  // namespace lspbridge::lsp

#endif  // LSPBRIDGE_LSP_FD_STREAM_H
