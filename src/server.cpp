// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <csignal>
#include <stdexcept>
#include <todomcp/jsonrpc.hpp>
#include <todomcp/logging.hpp>
#include <todomcp/server.hpp>

namespace todomcp
{

namespace
{

volatile std::sig_atomic_t g_stop_requested = 0;

} // namespace

void request_stop() noexcept
{
    g_stop_requested = 1;
}

bool stop_requested() noexcept
{
    return g_stop_requested != 0;
}

void clear_stop_request() noexcept
{
    g_stop_requested = 0;
}

Server::Server(std::unique_ptr<ITransport> transport, const Dispatcher& dispatcher)
    : transport_(std::move(transport)),
      framer_(transport_ ? *transport_ : throw std::invalid_argument("Transport cannot be null")),
      dispatcher_(dispatcher)
{
}

void Server::run()
{
    logger()->info("Server loop started");

    while (true)
    {
        if (stop_requested())
        {
            logger()->info("Stop requested, stopping");
            break;
        }

        std::string line;
        try
        {
            line = framer_.read_message();
        }
        catch (const ConnectionClosedError&)
        {
            logger()->info("Input closed, stopping");
            break;
        }
        catch (const TransportError& e)
        {
            logger()->error("Read failed: {}", e.what());
            break;
        }

        auto response = handle_line(line);
        if (!response)
            continue;

        try
        {
            framer_.write_message(*response);
            ++responses_sent_;
        }
        catch (const TransportError& e)
        {
            logger()->error("Write failed: {}", e.what());
            break;
        }
    }

    logger()->info("Server loop stopped after {} responses", responses_sent_);
}

std::optional<std::string> Server::handle_line(const std::string& line) const
{
    json request = json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object())
    {
        logger()->debug("Dropping frame that is not a JSON object ({} bytes)", line.size());
        return std::nullopt;
    }

    const std::optional<json> id = request_id(request);

    try
    {
        json result = dispatcher_.handle(request);
        return make_response(result, id).dump();
    }
    catch (const std::exception& e)
    {
        logger()->error("Internal error while handling request: {}", e.what());
        return make_internal_error(e.what(), id).dump();
    }
}

} // namespace todomcp
