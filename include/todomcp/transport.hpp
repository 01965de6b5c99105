// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace todomcp
{

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Base error for a failed read or write on the byte stream
class TransportError : public std::runtime_error
{
  public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

/// The stream ended or the peer went away
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

// =============================================================================
// Transport Interface
// =============================================================================

/// Byte stream underneath the line framer
///
/// The server reads requests from and writes responses to one of these.
/// StdioTransport is the production implementation; tests substitute an
/// in-memory one.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Fill `buffer` with at most `size` bytes
    /// @return Bytes placed in `buffer`; 0 means the stream has ended
    /// @throws TransportError if the underlying read fails
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write `size` bytes from `data`, blocking until all are written
    /// @throws ConnectionClosedError if the peer is gone
    /// @throws TransportError on any other write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Release the stream; further writes throw ConnectionClosedError
    virtual void close() = 0;

    /// False after close() or once end-of-stream has been read
    virtual bool is_open() const = 0;

    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Newline-Delimited Message Framer
// =============================================================================

/// Handles newline framing for JSON-RPC messages
///
/// Message format:
/// ```
/// <json-rpc-message>\n
/// ```
///
/// A trailing `\r` before the newline is dropped. A final line without a
/// terminating newline is still delivered before end-of-stream is reported.
class LineFramer
{
  public:
    explicit LineFramer(ITransport& transport) : transport_(transport) {}

    /// Read one line (without its terminator)
    /// @throws ConnectionClosedError at end-of-stream with no pending bytes
    /// @throws TransportError on read failure
    std::string read_message();

    /// Write a message followed by a newline in a single transport write
    /// @throws TransportError on write failure
    void write_message(const std::string& message);

  private:
    ITransport& transport_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;
    bool eof_ = false;

    /// Refill the buffer; returns false at end-of-stream
    bool fill_buffer();
};

// =============================================================================
// Inline implementations
// =============================================================================

inline std::string LineFramer::read_message()
{
    std::string line;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_ && !fill_buffer())
        {
            if (line.empty())
                throw ConnectionClosedError("Connection closed while reading line");
            break;
        }

        // Consume up to the next newline in one step
        const char* begin = buffer_.data() + buffer_pos_;
        const char* end = buffer_.data() + buffer_len_;
        const char* nl = std::find(begin, end, '\n');
        line.append(begin, nl);
        buffer_pos_ += static_cast<size_t>(nl - begin);

        if (nl != end)
        {
            ++buffer_pos_; // skip '\n'
            break;
        }
    }

    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

inline void LineFramer::write_message(const std::string& message)
{
    std::string frame;
    frame.reserve(message.size() + 1);
    frame.append(message);
    frame.push_back('\n');
    transport_.write(frame);
}

inline bool LineFramer::fill_buffer()
{
    if (eof_)
        return false;

    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    if (buffer_len_ == 0)
    {
        eof_ = true;
        return false;
    }
    return true;
}

} // namespace todomcp
