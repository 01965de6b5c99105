// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

/// todo-mcp-server: todo list over line-delimited JSON-RPC on stdin/stdout.
///
/// Environment:
///   TODO_MCP_DB         database path (default ~/.local/share/nvim/todo-mcp.db)
///   TODO_MCP_LOG_LEVEL  stderr log level (default warn)

#include <todomcp/todomcp.hpp>

#include <csignal>
#include <signal.h>
#include <cstring>
#include <exception>
#include <memory>
#include <unistd.h>

namespace
{

void on_stop_signal(int)
{
    // Checked before every read; no SA_RESTART so a blocked read returns too
    todomcp::request_stop();
}

void install_stop_handlers()
{
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A vanished client shows up as EPIPE on write instead of killing us
    std::signal(SIGPIPE, SIG_IGN);
}

} // namespace

int main()
{
    using namespace todomcp;

    ServerOptions options = ServerOptions::from_env();
    init_logging(options.log_level);
    install_stop_handlers();

    try
    {
        SqliteTodoStore store(options.db_path);
        ToolRegistry registry(make_todo_tools(store));
        Dispatcher dispatcher(registry);

        logger()->info("{} {} serving {} tools", kServerName, kServerVersion, registry.size());

        Server server(
            std::make_unique<StdioTransport>(STDIN_FILENO, STDOUT_FILENO, false), dispatcher
        );
        server.run();
    }
    catch (const std::exception& e)
    {
        logger()->critical("Fatal: {}", e.what());
        return 1;
    }

    return 0;
}
