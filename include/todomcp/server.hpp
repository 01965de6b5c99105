// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file server.hpp
/// @brief Line-delimited JSON-RPC loop

#include <memory>
#include <optional>
#include <string>
#include <todomcp/dispatcher.hpp>
#include <todomcp/transport.hpp>

namespace todomcp
{

// =============================================================================
// Stop Requests
// =============================================================================

/// Ask running Server loops to return before their next read
///
/// Only writes a `volatile std::sig_atomic_t`, so it is safe to call from a
/// signal handler.
void request_stop() noexcept;

/// True once request_stop() has been called and not cleared
bool stop_requested() noexcept;

/// Reset the stop request (for a process that serves again)
void clear_stop_request() noexcept;

/// Reads request frames, dispatches them and writes one response per frame
///
/// Single-threaded: a request is read, dispatched and answered before the next
/// line is read. Lines that are not a JSON object are dropped without a
/// response. A failure while handling a parsed frame produces a -32603 error
/// frame and the loop continues.
///
/// Example usage:
/// @code
/// SqliteTodoStore store(options.db_path);
/// ToolRegistry registry(make_todo_tools(store));
/// Dispatcher dispatcher(registry);
///
/// Server server(std::make_unique<StdioTransport>(STDIN_FILENO, STDOUT_FILENO, false), dispatcher);
/// server.run(); // returns at end-of-stream
/// @endcode
class Server
{
  public:
    /// @param transport Byte transport (takes ownership)
    /// @param dispatcher Method router; must outlive the server
    Server(std::unique_ptr<ITransport> transport, const Dispatcher& dispatcher);

    // Non-copyable, non-movable (framer refers to the owned transport)
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    /// Serve until end-of-stream, a stop request, or a transport failure
    ///
    /// A stop request that arrives while a request is being handled takes
    /// effect once its response has been written.
    void run();

    /// Handle one line of input
    /// @return The serialized response frame, or nullopt if the line is dropped
    std::optional<std::string> handle_line(const std::string& line) const;

    /// Number of response frames written by run()
    size_t responses_sent() const
    {
        return responses_sent_;
    }

  private:
    std::unique_ptr<ITransport> transport_;
    LineFramer framer_;
    const Dispatcher& dispatcher_;
    size_t responses_sent_ = 0;
};

} // namespace todomcp
