// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <todomcp/transport.hpp>

#include <cerrno>
#include <cstring>
#include <unistd.h>

#include <atomic>
#include <string>

namespace todomcp
{

/// Transport that wraps file descriptors (stdin/stdout or pipe ends)
///
/// This is the server's only production transport: requests arrive on the
/// read descriptor and responses leave on the write descriptor. Writes go
/// straight to the descriptor, so every frame is flushed when write() returns.
///
/// A read interrupted by a signal (EINTR) is reported as end-of-stream, which
/// lets SIGINT/SIGTERM end the server loop cleanly.
class StdioTransport : public ITransport
{
  public:
    using Handle = int;
    static constexpr Handle invalid_handle()
    {
        return -1;
    }

    /// Construct from read/write handles
    /// @param read_handle Handle to read from (e.g., STDIN_FILENO)
    /// @param write_handle Handle to write to (e.g., STDOUT_FILENO)
    /// @param owns_handles If true, handles will be closed on destruction
    StdioTransport(Handle read_handle, Handle write_handle, bool owns_handles = true)
        : read_handle_(read_handle), write_handle_(write_handle), owns_handles_(owns_handles),
          open_(true)
    {
    }

    ~StdioTransport() override
    {
        close();
    }

    // Non-copyable, non-movable
    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;
    StdioTransport(StdioTransport&&) = delete;
    StdioTransport& operator=(StdioTransport&&) = delete;

    size_t read(char* buffer, size_t size) override;
    void write(const char* data, size_t size) override;
    using ITransport::write;
    void close() override;
    bool is_open() const override
    {
        return open_;
    }

  private:
    Handle read_handle_;
    Handle write_handle_;
    bool owns_handles_;
    std::atomic<bool> open_;
};

// =============================================================================
// Inline implementations
// =============================================================================

inline size_t StdioTransport::read(char* buffer, size_t size)
{
    if (!open_)
        throw ConnectionClosedError();

    ssize_t bytes_read = ::read(read_handle_, buffer, size);
    if (bytes_read < 0)
    {
        if (errno == EINTR || errno == EPIPE || errno == EBADF)
        {
            open_ = false;
            return 0;
        }
        throw TransportError("read() failed: " + std::string(strerror(errno)));
    }

    if (bytes_read == 0)
        open_ = false;
    return static_cast<size_t>(bytes_read);
}

inline void StdioTransport::write(const char* data, size_t size)
{
    if (write_handle_ == invalid_handle())
        throw ConnectionClosedError();

    size_t total_written = 0;
    while (total_written < size)
    {
        ssize_t bytes_written = ::write(write_handle_, data + total_written, size - total_written);
        if (bytes_written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ConnectionClosedError("Peer closed the output stream");
            throw TransportError("write() failed: " + std::string(strerror(errno)));
        }
        total_written += static_cast<size_t>(bytes_written);
    }
}

inline void StdioTransport::close()
{
    // open_ also drops at end-of-stream, so the handles decide whether work remains
    open_ = false;

    if (owns_handles_)
    {
        if (read_handle_ != invalid_handle())
            ::close(read_handle_);
        if (write_handle_ != invalid_handle() && write_handle_ != read_handle_)
            ::close(write_handle_);
    }
    read_handle_ = invalid_handle();
    write_handle_ = invalid_handle();
}

} // namespace todomcp
