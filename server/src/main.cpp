//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/core/span.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "server.hpp"
#include "services/broadcast_hub.hpp"
#include "services/mysql_client.hpp"
#include "services/redis_client.hpp"
#include "shared_state.hpp"

namespace asio = boost::asio;
using namespace msghub;

static constexpr std::chrono::seconds shutdown_grace_period{2};

static void main_impl(int argc, char* argv[])
{
    // Read the configuration from the command line and the environment
    auto cfg = load_config(
        boost::span<const char* const>(argv, static_cast<std::size_t>(argc)),
        [](const char* name) -> const char* { return std::getenv(name); }
    );
    if (cfg.has_error())
    {
        std::cerr << cfg.error().msg << "\n\n" << usage(argv[0]);
        exit(EXIT_FAILURE);
    }

    // An event loop, where the application will run. The server is single-
    // threaded, so we set the concurrency hint to 1
    asio::io_context ctx(1);

    // Singleton objects shared by all connections. Opens the message store
    auto st = std::make_shared<shared_state>(std::move(*cfg), ctx.get_executor());

    // A signal_set allows us to intercept SIGINT and SIGTERM and
    // exit gracefully
    asio::signal_set signals(ctx.get_executor(), SIGINT, SIGTERM);

    // Launch the Redis connection, where sessions live
    st->redis().start_run();

    // Launch the MySQL connection pool
    st->mysql().start_run();

    // Create the tables we need, if they don't exist yet. Requests
    // issued before this finishes will wait for the pool to connect
    asio::co_spawn(
        ctx,
        [st]() -> asio::awaitable<void> {
            auto res = co_await st->mysql().setup_db();
            if (res.has_error())
                log_error(res.error(), "Setting up the database");
        },
        [](std::exception_ptr exc) {
            if (exc)
                std::rethrow_exception(exc);
        }
    );

    // Serve until stopped. A failure to bind propagates to main
    asio::co_spawn(ctx, run_server(st), [](std::exception_ptr exc) {
        if (exc)
            std::rethrow_exception(exc);
    });

    // Capture SIGINT and SIGTERM to perform a clean shutdown.
    // Closing the hub makes event streams finish on their own. They, and any
    // in-flight requests, get a grace period before everything is stopped
    asio::steady_timer drain_timer(ctx.get_executor());
    signals.async_wait([st, &ctx, &drain_timer](boost::system::error_code, int) {
        log_info("Shutting down");
        st->hub().close();

        drain_timer.expires_after(shutdown_grace_period);
        drain_timer.async_wait([st, &ctx](boost::system::error_code) {
            // Stop the reconnection loops
            st->redis().cancel();
            st->mysql().cancel();

            // Sessions blocked reading keep-alive connections never finish by themselves
            ctx.stop();
        });
    });

    // Run the io_context. This will block until the context is stopped by
    // a signal and all outstanding async tasks are finished.
    ctx.run();

    // (If we get here, it means we got a SIGINT or SIGTERM)
}

int main(int argc, char* argv[])
{
    try
    {
        main_impl(argc, argv);
    }
    catch (const std::exception& err)
    {
        std::cerr << "Exception in main(): " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
