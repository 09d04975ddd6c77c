/*
Module Name:
- http_client.hpp

Abstract:
- HTTPS/1.1 client over Boost.Beast with a small keep-alive connection pool.
- request() returns the raw status and body so callers can act on statuses
  such as 204 No Content or 401 themselves.
- post_json() and get_json() parse the body with Glaze and throw status_error
  on non-2xx, for the common "call an API, read JSON" case.
- Every step (DNS, connect, TLS, write, read) runs under a Beast stream expiry.
  An optional total budget caps the sum so one call can never hang a loop.
*/
#pragma once

// C++ standard library
#include <chrono>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// Boost.Asio
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

// Glaze
#include <glaze/json.hpp>

// Project
#include <dm/utils/transparent_string_hash.hpp>

namespace http_client {

// JSON options visible to both header and source
inline constexpr glz::opts json_opts{
    .null_terminated         = true,
    .error_on_unknown_keys   = false,
    .minified                = true,
};

// Type aliases for JSON values and results
using json   = glz::json_t;
using result = glz::expected<json, glz::error_ctx>;

// HTTP header types
using http_header  = std::pair<std::string_view, std::string_view>;
using http_headers = std::span<const http_header>;

// Default pool sizes
inline constexpr std::size_t k_default_expected_hosts       = 8;
inline constexpr std::size_t k_default_connections_per_host = 4;

// HTTP and pooling constants
inline constexpr int         k_http_version        = 11;
inline constexpr auto        k_tcp_connect_timeout = std::chrono::seconds{10};
inline constexpr auto        k_handshake_timeout   = std::chrono::seconds{10};
inline constexpr auto        k_http_write_timeout  = std::chrono::seconds{10};
inline constexpr auto        k_http_read_timeout   = std::chrono::seconds{15};
inline constexpr auto        k_pool_idle_timeout   = std::chrono::seconds{60};
inline constexpr std::size_t k_max_body_bytes      = 8U * 1024U * 1024U;

// Raw outcome of one exchange.
struct response {
    int         status{0};
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

// Thrown by the JSON helpers when the server answers with a non-2xx status.
class status_error final : public std::runtime_error
{
public:
    status_error(std::string_view host, std::string_view target, int status);

    [[nodiscard]] int status() const noexcept { return status_; }

private:
    int status_;
};

// Parse a JSON document. The input is copied so Glaze sees a NUL-terminated buffer.
[[nodiscard]] result parse_json(std::string_view text);

class client
{
public:
    struct RequestOptions {
        // Per-step timeout overrides; 0 => use client defaults
        std::chrono::steady_clock::duration tcp_connect_timeout{};
        std::chrono::steady_clock::duration tls_handshake_timeout{};
        std::chrono::steady_clock::duration write_timeout{};
        std::chrono::steady_clock::duration read_timeout{};

        // Budget for the whole exchange; 0 => only per-step limits apply
        std::chrono::steady_clock::duration total_timeout{};

        // Leave empty to use defaults
        std::string accept;
        std::string content_type;
    };

    client(boost::asio::any_io_executor executor,
           boost::asio::ssl::context&   ssl_context,
           std::size_t                  expected_hosts = k_default_expected_hosts,
           std::size_t expected_conns_per_host        = k_default_connections_per_host) noexcept;

    client(const client&)            = delete;
    client& operator=(const client&) = delete;

    // One exchange; any status is returned, transport failures throw std::system_error.
    [[nodiscard]]
    boost::asio::awaitable<response> request(boost::beast::http::verb method,
                                             std::string_view host,
                                             std::string_view port,
                                             std::string_view target,
                                             std::string_view body,
                                             http_headers     headers,
                                             const RequestOptions* opts = nullptr);

    // Same as request() for an absolute https URL.
    [[nodiscard]]
    boost::asio::awaitable<response> request_url(boost::beast::http::verb method,
                                                 std::string_view url,
                                                 std::string_view body,
                                                 http_headers     headers,
                                                 const RequestOptions* opts = nullptr);

    [[nodiscard]]
    boost::asio::awaitable<result> get_json(std::string_view host,
                                            std::string_view port,
                                            std::string_view target,
                                            http_headers headers = {},
                                            const RequestOptions* opts = nullptr);

    [[nodiscard]]
    boost::asio::awaitable<result> post_json(std::string_view host,
                                             std::string_view port,
                                             std::string_view target,
                                             std::string_view body,
                                             http_headers headers = {},
                                             const RequestOptions* opts = nullptr);

    /// Close all pooled connections (e.g., on shutdown).
    void shutdown() noexcept;

private:
    struct connection {
        using tcp_stream = boost::beast::tcp_stream;
        using ssl_stream = boost::beast::ssl_stream<tcp_stream>;

        ssl_stream                            stream;
        boost::beast::flat_buffer             buffer;
        std::chrono::steady_clock::time_point last_used;

        explicit connection(ssl_stream s) noexcept
            : stream(std::move(s)), buffer(), last_used(std::chrono::steady_clock::now()) {}

        void reset() noexcept { buffer.clear(); }
        void mark_used() noexcept { last_used = std::chrono::steady_clock::now(); }
    };

    using connection_ptr = std::shared_ptr<connection>;

    [[nodiscard]] connection_ptr acquire(std::string_view key);
    void release(std::string_view key, connection_ptr conn) noexcept;

    [[nodiscard]]
    boost::asio::awaitable<connection_ptr> connect(std::string_view host,
                                                   std::string_view port,
                                                   const RequestOptions* opts,
                                                   std::chrono::steady_clock::time_point deadline);

    // defaulted timeouts if per-request options are absent
    static inline std::chrono::steady_clock::duration or_default(
        std::chrono::steady_clock::duration v,
        std::chrono::steady_clock::duration def) noexcept
    {
        return (v == std::chrono::steady_clock::duration::zero()) ? def : v;
    }

    boost::asio::any_io_executor executor_;
    boost::asio::ssl::context*   ssl_context_; // non-null

    // hetero-lookup pool keyed by "host:port"; guarded by pool_mutex_
    std::mutex                                          pool_mutex_;
    dm::StringMap<std::vector<connection_ptr>>          pool_;
    std::size_t                                         expected_conns_per_host_{};
};

} // namespace http_client
