#include "common/http_client.hpp"
#include "common/json_util.hpp"
#include "common/log.hpp"
#include "common/net_utils.hpp"
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

namespace voxfleet {

namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

namespace {

const log::Logger& logger() { return log::Logger::get("common.http"); }

constexpr const char* USER_AGENT = "VoxFleet/1.0";

// Write the request and read the response on an already connected stream
template<typename Stream>
net::awaitable<HttpResult> exchange(Stream& stream, http::request<http::string_body>& req) {
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    co_await http::async_read(stream, buffer, res, net::use_awaitable);

    HttpResult result;
    result.status = res.result_int();
    result.body = std::move(res.body());
    co_return result;
}

FleetError map_error(const boost::system::error_code& ec) {
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return FleetError::TIMEOUT;
    }
    return FleetError::CONNECTION_FAILED;
}

} // anonymous namespace

std::optional<boost::json::object> HttpResult::json() const {
    return parse_object(body);
}

HttpClient::HttpClient(net::any_io_executor executor)
    : executor_(std::move(executor))
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

net::awaitable<std::expected<HttpResult, FleetError>> HttpClient::request(
    http::verb method,
    const std::string& url,
    std::string body,
    const std::string& bearer_token,
    std::chrono::milliseconds timeout)
{
    auto parts = parse_url(url);
    if (!parts || (parts->scheme != "http" && parts->scheme != "https")) {
        logger().debug("Rejecting URL '{}'", url);
        co_return std::unexpected(FleetError::INVALID_URL);
    }

    http::request<http::string_body> req{method, parts->target, 11};
    req.set(http::field::host, parts->has_port ? parts->host + ":" + std::to_string(parts->port) : parts->host);
    req.set(http::field::user_agent, USER_AGENT);
    req.set(http::field::accept, "application/json");
    if (!bearer_token.empty()) {
        req.set(http::field::authorization, "Bearer " + bearer_token);
    }
    if (method == http::verb::post || method == http::verb::put || !body.empty()) {
        req.set(http::field::content_type, "application/json");
        req.body() = std::move(body);
    }
    req.keep_alive(false);
    req.prepare_payload();

    try {
        tcp::resolver resolver(executor_);
        auto endpoints = co_await resolver.async_resolve(
            parts->host, std::to_string(parts->port), net::use_awaitable);

        if (parts->use_ssl) {
            beast::ssl_stream<beast::tcp_stream> stream(executor_, ssl_ctx_);

            // Set SNI hostname
            if (!SSL_set_tlsext_host_name(stream.native_handle(), parts->host.c_str())) {
                throw boost::system::system_error(
                    boost::system::error_code(
                        static_cast<int>(::ERR_get_error()),
                        net::error::get_ssl_category()));
            }

            beast::get_lowest_layer(stream).expires_after(timeout);
            co_await beast::get_lowest_layer(stream).async_connect(endpoints, net::use_awaitable);
            co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

            auto result = co_await exchange(stream, req);

            // Peers often drop TLS without close_notify; the response is already complete
            boost::system::error_code ec;
            beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(1));
            co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
            co_return result;
        }

        beast::tcp_stream stream(executor_);
        stream.expires_after(timeout);
        co_await stream.async_connect(endpoints, net::use_awaitable);

        auto result = co_await exchange(stream, req);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return result;

    } catch (const boost::system::system_error& e) {
        logger().trace("{} {} failed: {}", std::string(http::to_string(method)), url, e.code().message());
        co_return std::unexpected(map_error(e.code()));
    }
}

net::awaitable<std::expected<HttpResult, FleetError>> HttpClient::get(
    const std::string& url,
    const std::string& bearer_token,
    std::chrono::milliseconds timeout)
{
    co_return co_await request(http::verb::get, url, {}, bearer_token, timeout);
}

net::awaitable<std::expected<HttpResult, FleetError>> HttpClient::post_json(
    const std::string& url,
    const boost::json::object& body,
    const std::string& bearer_token,
    std::chrono::milliseconds timeout)
{
    co_return co_await request(http::verb::post, url, boost::json::serialize(body), bearer_token, timeout);
}

} // namespace voxfleet
