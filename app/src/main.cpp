/*
Module: main.cpp

Purpose:
- Entry point that wires configuration, the Twitch adapters and the mining
  engine together, starts one mining session and waits for it to end.

Notes:
- Config is loaded from the first argument or ./config.toml. Fails fast with EnvError.
- The process ends when the session reports mining-complete or
  mining-stopped-no-channels, or on SIGINT/SIGTERM.
- Teardown order matters: engine first, then sockets, then the pool.
*/

// C++ Standard Library
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

// Core
#include <dm/mining/errors.hpp>
#include <dm/mining/event_bus.hpp>
#include <dm/mining/session_controller.hpp>
#include <dm/twitch/config.hpp>
#include <dm/twitch/gql_catalog_client.hpp>
#include <dm/twitch/pubsub_client.hpp>
#include <dm/twitch/static_credentials.hpp>

// App
#include <app/console_status_sink.hpp>

int main(int argc, char* argv[])
{
    try
    {
        // 1) Load immutable configuration.
        const auto cfg = (argc > 1) ? env::Config::load_file(argv[1]) : env::Config::load();
        std::cout << "[App] config " << cfg.path().string() << '\n';

        // 2) Worker pool and shared TLS config.
        boost::asio::thread_pool pool{ std::max(2u, std::thread::hardware_concurrency()) };
        boost::asio::ssl::context ssl_ctx{ boost::asio::ssl::context::tlsv12_client };
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);

        // 3) Adapters.
        drop_miner::twitch::StaticCredentialProvider creds{ cfg.auth().access_token };
        drop_miner::twitch::GqlCatalogClient client{ pool.get_executor(), ssl_ctx };
        drop_miner::EventBus bus{ pool.get_executor() };
        drop_miner::twitch::PubSubClient pubsub{ pool.get_executor(), ssl_ctx, bus };

        // 4) Completion latch: a terminal notification or a signal releases main().
        std::promise<void> done;
        auto done_future = done.get_future();
        std::once_flag done_once;
        auto release = [&] { std::call_once(done_once, [&] { done.set_value(); }); };

        app::ConsoleStatusSink sink{ [&](const drop_miner::Notification&) { release(); } };

        drop_miner::SessionController controller{
            pool.get_executor(), client, creds, pubsub, bus, sink, cfg.mining()
        };

        boost::asio::signal_set signals{ pool, SIGINT, SIGTERM };
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (!ec)
            {
                std::cout << "[App] signal " << signo << ", stopping\n";
                release();
            }
        });

        // 5) Start mining. Startup failures are reported after an orderly teardown.
        drop_miner::StartRequest request{};
        if (!cfg.target().campaign_id.empty())
        {
            request.campaign_id = cfg.target().campaign_id;
        }
        if (!cfg.target().channel_id.empty())
        {
            request.channel_id = cfg.target().channel_id;
        }

        std::exception_ptr failure;
        try
        {
            boost::asio::co_spawn(pool, controller.start(std::move(request)), boost::asio::use_future).get();
        }
        catch (const std::exception&)
        {
            failure = std::current_exception();
            release();
        }

        // 6) Block until the session ends. A session stopped by an auth failure
        //    sends no notification, so the run flag is watched as well.
        while (done_future.wait_for(std::chrono::seconds{ 1 }) != std::future_status::ready)
        {
            if (!controller.is_running())
            {
                break;
            }
        }

        // 7) Teardown: engine, then sockets, then drain the pool.
        boost::system::error_code ignored;
        signals.cancel(ignored);
        controller.stop();
        pubsub.disconnect();
        client.shutdown();
        pool.join();

        if (failure)
        {
            std::rethrow_exception(failure);
        }
    }
    catch (const env::EnvError& e)
    {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (const drop_miner::AuthError& e)
    {
        std::cerr << "Authentication error: " << e.what() << " (refresh the access token)\n";
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal error: " << e.what() << '\n';
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
