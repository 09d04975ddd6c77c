// Twitch PubSub client over TLS WebSocket.

// Why:
// - Keep the TCP, TLS and WS handshakes on deadlines so a dead edge never wedges the supervisor.
// - Enforce peer verification and SNI to prevent MITM.
// - Only one writer at a time: LISTEN is sent before the ping loop starts, after which
//   the ping loop is the sole writer on the stream.

// C++ Standard Library
#include <algorithm>
#include <array>
#include <atomic>
#include <iostream>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// GSL
#include <gsl/gsl>

// Project
#include <dm/twitch/json_nav.hpp>
#include <dm/twitch/pubsub_client.hpp>

namespace drop_miner::twitch
{

    using boost::asio::use_awaitable;
    using error_code = boost::system::error_code;
    using std::chrono::milliseconds;
    namespace beast = boost::beast;

    namespace
    {

        constexpr char k_host[] = "pubsub-edge.twitch.tv";
        constexpr char k_port[] = "443";
        constexpr char k_path[] = "/v1";

        constexpr auto k_connect_timeout = std::chrono::seconds{ 30 };
        constexpr auto k_ping_interval = std::chrono::minutes{ 4 };
        constexpr auto k_pong_timeout = std::chrono::seconds{ 10 };
        constexpr auto k_reconnect_base = milliseconds{ 2000 };
        constexpr auto k_backoff_cap = milliseconds{ 120000 };
        constexpr auto k_min_sleep = milliseconds{ 150 };
        constexpr std::size_t k_read_limit = 256ULL * 1024ULL;

        struct ListenData
        {
            std::vector<std::string> topics;
            std::string auth_token;
        };

        struct ListenFrame
        {
            std::string type{ "LISTEN" };
            std::string nonce;
            ListenData data;
        };

        struct PingFrame
        {
            std::string type{ "PING" };
        };

        std::string make_nonce()
        {
            static constexpr char hex[] = "0123456789abcdef";
            static thread_local std::mt19937 rng{ std::random_device{}() };
            std::uniform_int_distribution<int> dist(0, 15);
            std::string nonce(30, '0');
            for (auto& c : nonce)
            {
                c = hex[dist(rng)];
            }
            return nonce;
        }

    } // namespace

    namespace pubsub
    {

        std::string drop_events_topic(std::string_view user_id)
        {
            std::string topic{ "user-drop-events." };
            topic.append(user_id);
            return topic;
        }

        std::string make_listen_frame(std::string_view topic, std::string_view token, std::string_view nonce)
        {
            ListenFrame frame{};
            frame.nonce = std::string{ nonce };
            frame.data.topics.emplace_back(topic);
            frame.data.auth_token = std::string{ token };
            return json_nav::to_json(frame);
        }

        std::string make_ping_frame()
        {
            return json_nav::to_json(PingFrame{});
        }

        Frame parse_frame(std::string_view text)
        {
            using namespace json_nav;

            Frame out{};
            const auto root = http_client::parse_json(text);
            if (!root)
            {
                return out;
            }

            const auto type = string_of(member(&*root, "type"));
            if (type == "PONG")
            {
                out.kind = FrameKind::pong;
            }
            else if (type == "RECONNECT")
            {
                out.kind = FrameKind::reconnect;
            }
            else if (type == "RESPONSE")
            {
                out.kind = FrameKind::response;
                out.error = string_of(member(&*root, "error"));
            }
            else if (type == "MESSAGE")
            {
                out.kind = FrameKind::message;
                const json* data = member(&*root, "data");
                out.topic = string_of(member(data, "topic"));

                // The payload is a JSON document embedded as a string.
                const auto inner = http_client::parse_json(string_of(member(data, "message")));
                if (!inner)
                {
                    return out;
                }
                out.event_type = string_of(member(&*inner, "type"));
                if (out.event_type == "drop-progress")
                {
                    const json* payload = member(&*inner, "data");
                    ProgressEvent event{ string_of(member(payload, "drop_id")),
                                         int_of(member(payload, "current_progress_min")),
                                         int_of(member(payload, "required_progress_min")) };
                    if (!event.drop_id.empty())
                    {
                        out.progress = std::move(event);
                    }
                }
            }
            return out;
        }

        milliseconds next_backoff(unsigned& attempts, milliseconds base, milliseconds cap)
        {
            // Grows like base * 2^attempts, capped; randomise to avoid thundering herd.
            const unsigned exp = std::min<unsigned>(attempts, 16);
            const auto grown = base * (1u << exp);
            const auto max_d = grown > cap ? cap : grown;

            static thread_local std::mt19937 rng{ std::random_device{}() };
            std::uniform_int_distribution<long long> dist(0, max_d.count());

            ++attempts;
            return std::max(milliseconds{ dist(rng) }, k_min_sleep);
        }

    } // namespace pubsub

    /// One supervised subscription. Owns the socket and every timer; all members
    /// are touched on strand_ only, except the atomics.
    class PubSubClient::Link : public std::enable_shared_from_this<Link>
    {
    public:
        Link(boost::asio::any_io_executor executor,
             boost::asio::ssl::context& ssl_context,
             EventBus& bus,
             std::string user_id,
             std::string token) :
            strand_{ boost::asio::make_strand(executor) }, ssl_context_{ &ssl_context }, bus_{ &bus },
            user_id_{ std::move(user_id) }, token_{ std::move(token) }, ping_timer_{ strand_ }, pause_{ strand_ }
        {
        }

        ~Link() noexcept
        {
            std::fill(token_.begin(), token_.end(), '\0');
        }

        void start()
        {
            boost::asio::co_spawn(strand_, run(), [self = shared_from_this()](std::exception_ptr ep) {
                if (!ep)
                {
                    return;
                }
                try
                {
                    std::rethrow_exception(ep);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[PubSub] supervisor exited: " << e.what() << '\n';
                }
            });
        }

        void stop() noexcept
        {
            if (stopped_.exchange(true))
            {
                return;
            }
            try
            {
                boost::asio::post(strand_, [self = shared_from_this()] {
                    self->pause_.cancel();
                    self->ping_timer_.cancel();
                    self->drop_socket();
                });
            }
            catch (const std::exception& e)
            {
                std::cerr << "[PubSub] stop failed: " << e.what() << '\n';
            }
        }

        [[nodiscard]] bool listening() const noexcept
        {
            return listening_.load();
        }

    private:
        using tcp_stream_type = beast::tcp_stream;
        using ssl_stream_type = boost::asio::ssl::stream<tcp_stream_type>;
        using websocket_stream_type = beast::websocket::stream<ssl_stream_type>;

        auto run() -> boost::asio::awaitable<void>
        {
            while (!stopped_)
            {
                std::string reason;
                try
                {
                    reason = co_await session();
                }
                catch (const boost::system::system_error& e)
                {
                    reason = e.code().message();
                }
                catch (const std::exception& e)
                {
                    reason = e.what();
                }
                drop_socket();

                if (stopped_)
                {
                    break;
                }
                if (auth_failed_)
                {
                    std::cerr << "[PubSub] token rejected; realtime progress disabled\n";
                    break;
                }

                const auto delay = pubsub::next_backoff(attempts_, k_reconnect_base, k_backoff_cap);
                std::cout << "[PubSub] backoff#" << attempts_ << " reason=" << reason
                          << " sleep=" << delay.count() << "ms\n";

                error_code ec;
                pause_.expires_after(delay);
                co_await pause_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            }
            listening_ = false;
            std::cout << "[PubSub] stopped\n";
        }

        auto open() -> boost::asio::awaitable<void>
        {
            ws_.emplace(strand_, *ssl_context_);

            boost::asio::ip::tcp::resolver resolver{ strand_ };
            auto results = co_await resolver.async_resolve(k_host, k_port, use_awaitable);
            if (stopped_)
            {
                throw boost::system::system_error{ boost::asio::error::operation_aborted };
            }

            auto& tcp = beast::get_lowest_layer(*ws_);
            tcp.expires_after(k_connect_timeout);
            co_await tcp.async_connect(results, use_awaitable);
            tcp.socket().set_option(boost::asio::ip::tcp::no_delay(true));
            tcp.socket().set_option(boost::asio::socket_base::keep_alive(true));

            auto& ssl = ws_->next_layer();
            if (!::SSL_set_tlsext_host_name(ssl.native_handle(), k_host))
            {
                throw std::system_error{ static_cast<int>(::ERR_get_error()),
                                         boost::asio::error::get_ssl_category(),
                                         "SNI failure" };
            }
            (void)::SSL_set1_host(ssl.native_handle(), k_host);
            ssl.set_verify_mode(boost::asio::ssl::verify_peer);

            tcp.expires_after(k_connect_timeout);
            co_await ssl.async_handshake(boost::asio::ssl::stream_base::client, use_awaitable);
            tcp.expires_never();

            ws_->set_option(beast::websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws_->set_option(beast::websocket::stream_base::decorator([](beast::websocket::request_type& req) {
                req.set(beast::http::field::origin, "https://www.twitch.tv");
                req.set(beast::http::field::user_agent, "drop-miner/1.0 (+pubsub)");
            }));
            ws_->read_message_max(k_read_limit);

            co_await ws_->async_handshake(k_host, k_path, use_awaitable);
            ws_->text(true);
        }

        // Runs one connection until it fails; returns why it ended.
        auto session() -> boost::asio::awaitable<std::string>
        {
            co_await open();
            if (stopped_)
            {
                co_return "stopped";
            }

            co_await send(pubsub::make_listen_frame(pubsub::drop_events_topic(user_id_), token_, make_nonce()));

            const auto generation = ++generation_;
            awaiting_pong_ = false;
            boost::asio::co_spawn(strand_, ping_loop(generation), [self = shared_from_this(), generation](std::exception_ptr ep) {
                if (!ep)
                {
                    return;
                }
                try
                {
                    std::rethrow_exception(ep);
                }
                catch (const std::exception& e)
                {
                    std::cerr << "[PubSub] ping loop failed: " << e.what() << '\n';
                    if (self->generation_ == generation)
                    {
                        self->drop_socket();
                    }
                }
            });

            auto on_exit = gsl::finally([this] {
                listening_ = false;
                ++generation_;
                ping_timer_.cancel();
            });

            beast::flat_buffer buffer;
            for (;;)
            {
                buffer.clear();
                co_await ws_->async_read(buffer, use_awaitable);

                const auto frame = pubsub::parse_frame(beast::buffers_to_string(buffer.data()));
                switch (frame.kind)
                {
                case pubsub::FrameKind::pong:
                    awaiting_pong_ = false;
                    break;
                case pubsub::FrameKind::reconnect:
                    co_return "server requested reconnect";
                case pubsub::FrameKind::response:
                    if (!frame.error.empty())
                    {
                        auth_failed_ = frame.error == "ERR_BADAUTH";
                        co_return "LISTEN rejected: " + frame.error;
                    }
                    listening_ = true;
                    attempts_ = 0;
                    std::cout << "[PubSub] listening for drop events of user " << user_id_ << '\n';
                    break;
                case pubsub::FrameKind::message:
                    if (frame.progress)
                    {
                        bus_->publish(k_drop_progress_topic, *frame.progress);
                    }
                    else if (frame.event_type == "drop-claim")
                    {
                        std::cout << "[PubSub] drop claim pushed on " << frame.topic << '\n';
                    }
                    break;
                case pubsub::FrameKind::other:
                    break;
                }
            }
        }

        auto send(std::string frame) -> boost::asio::awaitable<void>
        {
            co_await ws_->async_write(boost::asio::buffer(frame), use_awaitable);
        }

        auto ping_loop(unsigned generation) -> boost::asio::awaitable<void>
        {
            // PubSub drops idle links after five minutes without a PING.
            for (;;)
            {
                error_code ec;
                ping_timer_.expires_after(k_ping_interval);
                co_await ping_timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
                if (ec || stopped_ || generation != generation_)
                {
                    co_return;
                }

                awaiting_pong_ = true;
                co_await send(pubsub::make_ping_frame());

                ping_timer_.expires_after(k_pong_timeout);
                co_await ping_timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
                if (ec || stopped_ || generation != generation_)
                {
                    co_return;
                }
                if (awaiting_pong_)
                {
                    std::cerr << "[PubSub] no PONG within " << k_pong_timeout.count() << "s; reconnecting\n";
                    drop_socket();
                    co_return;
                }
            }
        }

        // Abort pending I/O; the read in session() then fails and the supervisor reconnects.
        void drop_socket() noexcept
        {
            if (ws_)
            {
                beast::get_lowest_layer(*ws_).close();
            }
        }

        boost::asio::strand<boost::asio::any_io_executor> strand_;
        boost::asio::ssl::context* ssl_context_;
        EventBus* bus_;
        std::string user_id_;
        std::string token_;

        std::optional<websocket_stream_type> ws_;
        boost::asio::steady_timer ping_timer_;
        boost::asio::steady_timer pause_;

        std::atomic<bool> stopped_{ false };
        std::atomic<bool> listening_{ false };
        unsigned attempts_{ 0 };
        unsigned generation_{ 0 };
        bool awaiting_pong_{ false };
        bool auth_failed_{ false };
    };

    PubSubClient::PubSubClient(boost::asio::any_io_executor executor,
                               boost::asio::ssl::context& ssl_context,
                               EventBus& bus) :
        executor_{ std::move(executor) }, ssl_context_{ &ssl_context }, bus_{ &bus }
    {
    }

    PubSubClient::~PubSubClient()
    {
        disconnect();
    }

    void PubSubClient::connect(std::string user_id, std::string token)
    {
        Expects(!user_id.empty());

        auto link = std::make_shared<Link>(executor_, *ssl_context_, *bus_, std::move(user_id), std::move(token));
        std::shared_ptr<Link> previous;
        {
            std::lock_guard lk(mutex_);
            previous = std::exchange(link_, link);
        }
        if (previous)
        {
            previous->stop();
        }
        link->start();
    }

    void PubSubClient::disconnect() noexcept
    {
        std::shared_ptr<Link> link;
        {
            std::lock_guard lk(mutex_);
            link = std::move(link_);
        }
        if (link)
        {
            link->stop();
        }
    }

    bool PubSubClient::listening() const noexcept
    {
        std::lock_guard lk(mutex_);
        return link_ && link_->listening();
    }

} // namespace drop_miner::twitch
