// C++ standard library
#include <algorithm>
#include <system_error>
#include <utility>

// Boost.Asio
#include <boost/asio/connect.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>

// Boost.Beast
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

// OpenSSL
#include <openssl/err.h>
#include <openssl/ssl.h>

// Glaze
#include <glaze/json.hpp>

// GSL
#include <gsl/gsl>

// Project
#include <dm/net/http/error.hpp>
#include <dm/net/http/http_client.hpp>
#include <dm/net/http/url.hpp>

namespace http_client {

namespace {

    using steady = std::chrono::steady_clock;

    constexpr std::string_view k_user_agent
        = "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) "
          "Chrome/120.0.0.0 Safari/537.36";

    // Build a key for the connection-pool map.
    std::string make_pool_key(std::string_view host, std::string_view port)
    {
        std::string key;
        key.reserve(host.size() + 1 + port.size());
        key.append(host);
        key.push_back(':');
        key.append(port);
        return key;
    }

    // Produce Host header value, appending :port when it is not 443.
    std::string host_header_value(std::string_view host, std::string_view port)
    {
        std::string v{host};
        if (!port.empty() && port != "443") {
            v.push_back(':');
            v.append(port);
        }
        return v;
    }

    // Beast's string_view type differs between Boost releases; convert explicitly.
    boost::beast::string_view to_bsv(std::string_view s) noexcept
    {
        return {s.data(), s.size()};
    }

    // Step timeout clipped to what is left of the overall budget.
    steady::duration step_budget(steady::duration step, steady::time_point deadline)
    {
        if (deadline == steady::time_point::max()) return step;
        const auto left = deadline - steady::now();
        if (left <= steady::duration::zero()) {
            throw std::system_error(dm::net::make_error_code(dm::net::errc::deadline_exceeded));
        }
        return std::min(step, left);
    }

    std::string make_status_msg(std::string_view host, std::string_view target, int status)
    {
        std::string msg;
        msg.reserve(host.size() + target.size() + 32);
        msg.append(host).append(target).append(" returned ").append(std::to_string(status));
        return msg;
    }

} // namespace

status_error::status_error(std::string_view host, std::string_view target, int status)
    : std::runtime_error{make_status_msg(host, target, status)}
    , status_{status}
{
}

result parse_json(std::string_view text)
{
    // std::string keeps a trailing NUL, which json_opts.null_terminated relies on.
    std::string buffer{text};
    json j{};
    if (glz::error_ctx ec = glz::read<json_opts>(j, buffer); ec) {
        return glz::unexpected(ec);
    }
    return j;
}

client::client(boost::asio::any_io_executor executor,
               boost::asio::ssl::context&   ssl_context,
               std::size_t                  expected_hosts,
               std::size_t                  expected_conns_per_host) noexcept
    : executor_{executor}
    , ssl_context_{&ssl_context}
    , expected_conns_per_host_{expected_conns_per_host}
{
    Expects(ssl_context_ != nullptr);
    pool_.reserve(expected_hosts);
}

void client::shutdown() noexcept
{
    std::lock_guard lk(pool_mutex_);
    for (auto& [key, vec] : pool_) {
        for (auto& c : vec) {
            if (!c) continue;
            boost::system::error_code ec;
            boost::beast::get_lowest_layer(c->stream).socket().shutdown(
                boost::asio::ip::tcp::socket::shutdown_both, ec);
            boost::beast::get_lowest_layer(c->stream).socket().close(ec);
        }
        vec.clear();
    }
    pool_.clear();
}

auto client::acquire(std::string_view key) -> connection_ptr
{
    std::lock_guard lk(pool_mutex_);
    auto it = pool_.find(key);
    while (it != pool_.end() && !it->second.empty()) {
        connection_ptr conn = std::move(it->second.back());
        it->second.pop_back();
        // Drop idle connections; the server has most likely closed them.
        if (conn && steady::now() - conn->last_used <= k_pool_idle_timeout) {
            return conn;
        }
    }
    return nullptr;
}

void client::release(std::string_view key, connection_ptr conn) noexcept
{
    if (!conn || !boost::beast::get_lowest_layer(conn->stream).socket().is_open()) return;
    try {
        std::lock_guard lk(pool_mutex_);
        auto [it, inserted] = pool_.try_emplace(std::string{key});
        if (inserted) it->second.reserve(expected_conns_per_host_);
        if (it->second.size() < expected_conns_per_host_) {
            conn->mark_used();
            it->second.push_back(std::move(conn));
        }
    } catch (const std::bad_alloc&) {
        // Pool is an optimisation only; the connection is simply dropped.
    }
}

auto client::connect(std::string_view host,
                     std::string_view port,
                     const RequestOptions* opts,
                     steady::time_point deadline) -> boost::asio::awaitable<connection_ptr>
{
    namespace asio  = boost::asio;
    namespace beast = boost::beast;

    // DNS has no stream expiry; a timer on the same strand cancels a stalled lookup.
    auto strand   = asio::make_strand(executor_);
    auto resolver = std::make_shared<asio::ip::tcp::resolver>(strand);
    asio::steady_timer guard{strand};
    guard.expires_after(step_budget(
        or_default(opts ? opts->tcp_connect_timeout : steady::duration{}, k_tcp_connect_timeout),
        deadline));
    guard.async_wait([resolver](boost::system::error_code ec) {
        if (!ec) resolver->cancel();
    });
    auto stop_guard = gsl::finally([&guard] {
        boost::system::error_code ignored;
        guard.cancel(ignored);
    });

    const std::string host_str{host}; // NUL-terminated for SNI
    auto endpoints = co_await resolver->async_resolve(host_str, std::string{port}, asio::use_awaitable);

    beast::tcp_stream tcp(executor_);
    tcp.expires_after(step_budget(
        or_default(opts ? opts->tcp_connect_timeout : steady::duration{}, k_tcp_connect_timeout),
        deadline));
    co_await tcp.async_connect(endpoints, asio::use_awaitable);
    tcp.socket().set_option(asio::ip::tcp::no_delay{true});

    connection::ssl_stream ssl{std::move(tcp), *ssl_context_};
    if (!::SSL_set_tlsext_host_name(ssl.native_handle(), host_str.c_str())) {
        throw std::system_error{static_cast<int>(::ERR_get_error()),
                                asio::error::get_ssl_category(), "SNI failure"};
    }
    (void)::SSL_set1_host(ssl.native_handle(), host_str.c_str());

    beast::get_lowest_layer(ssl).expires_after(step_budget(
        or_default(opts ? opts->tls_handshake_timeout : steady::duration{}, k_handshake_timeout),
        deadline));
    co_await ssl.async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);

    co_return std::make_shared<connection>(std::move(ssl));
}

auto client::request(boost::beast::http::verb method,
                     std::string_view         host,
                     std::string_view         port,
                     std::string_view         target,
                     std::string_view         body,
                     http_headers             headers,
                     const RequestOptions*    opts) -> boost::asio::awaitable<response>
{
    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace http  = beast::http;

    Expects(!host.empty());

    const auto deadline = (opts && opts->total_timeout > steady::duration::zero())
        ? steady::now() + opts->total_timeout
        : steady::time_point::max();

    const std::string cur_port = port.empty() ? std::string{"443"} : std::string{port};
    const std::string key      = make_pool_key(host, cur_port);

    http::request<http::string_body> req{method, std::string{target}, k_http_version};
    req.set(http::field::host, host_header_value(host, cur_port));
    req.set(http::field::user_agent, to_bsv(k_user_agent));
    req.set(http::field::accept,
            to_bsv((opts && !opts->accept.empty()) ? std::string_view{opts->accept}
                                                   : std::string_view{"application/json"}));
    req.set(http::field::accept_encoding, "identity");
    if (method == http::verb::post || !body.empty()) {
        req.set(http::field::content_type,
                to_bsv((opts && !opts->content_type.empty()) ? std::string_view{opts->content_type}
                                                             : std::string_view{"application/json"}));
        req.body() = std::string{body};
        req.prepare_payload();
    }
    // Caller headers win over the defaults above.
    for (auto& h : headers) req.set(to_bsv(h.first), to_bsv(h.second));

    // A pooled socket may have been closed by the peer; retry once on a fresh one.
    for (int attempt = 0; attempt < 2; ++attempt) {
        connection_ptr conn   = (attempt == 0) ? acquire(key) : nullptr;
        const bool     reused = static_cast<bool>(conn);
        if (!conn) {
            conn = co_await connect(host, cur_port, opts, deadline);
        }

        try {
            conn->reset();
            beast::get_lowest_layer(conn->stream).expires_after(step_budget(
                or_default(opts ? opts->write_timeout : steady::duration{}, k_http_write_timeout),
                deadline));
            co_await http::async_write(conn->stream, req, asio::use_awaitable);

            http::response_parser<http::string_body> parser;
            parser.body_limit(k_max_body_bytes);
            beast::get_lowest_layer(conn->stream).expires_after(step_budget(
                or_default(opts ? opts->read_timeout : steady::duration{}, k_http_read_timeout),
                deadline));
            co_await http::async_read(conn->stream, conn->buffer, parser, asio::use_awaitable);
            beast::get_lowest_layer(conn->stream).expires_never();

            auto res = parser.release();
            if (res.keep_alive()) {
                release(key, std::move(conn));
            }
            co_return response{static_cast<int>(res.result_int()), std::move(res.body())};
        } catch (const boost::system::system_error&) {
            if (!reused) throw;
        }
    }

    // unreachable: the second attempt always uses a fresh connection and rethrows
    throw std::runtime_error("request retry logic fell through");
}

auto client::request_url(boost::beast::http::verb method,
                         std::string_view         url,
                         std::string_view         body,
                         http_headers             headers,
                         const RequestOptions*    opts) -> boost::asio::awaitable<response>
{
    const auto parsed = dm::net::parse_url(url);
    if (!parsed) {
        throw std::system_error(dm::net::make_error_code(dm::net::errc::malformed_url),
                                std::string{url});
    }
    if (parsed->scheme != "https") {
        throw std::system_error(dm::net::make_error_code(dm::net::errc::unsupported_scheme),
                                std::string{url});
    }
    co_return co_await request(method, parsed->host, parsed->port, parsed->target(), body,
                               headers, opts);
}

auto client::get_json(std::string_view host,
                      std::string_view port,
                      std::string_view target,
                      http_headers     headers,
                      const RequestOptions* opts) -> boost::asio::awaitable<result>
{
    auto res = co_await request(boost::beast::http::verb::get, host, port, target, {}, headers, opts);
    if (!res.ok()) {
        throw status_error(host, target, res.status);
    }
    co_return parse_json(res.body);
}

auto client::post_json(std::string_view host,
                       std::string_view port,
                       std::string_view target,
                       std::string_view body,
                       http_headers     headers,
                       const RequestOptions* opts) -> boost::asio::awaitable<result>
{
    auto res = co_await request(boost::beast::http::verb::post, host, port, target, body, headers, opts);
    if (!res.ok()) {
        throw status_error(host, target, res.status);
    }
    co_return parse_json(res.body);
}

} // namespace http_client
