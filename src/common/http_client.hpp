#pragma once

#include "common/errors.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace voxfleet {

namespace net = boost::asio;
namespace http = boost::beast::http;
namespace ssl = boost::asio::ssl;

struct HttpResult {
    unsigned status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }

    // nullopt when the body is not a JSON object
    std::optional<boost::json::object> json() const;
};

/**
 * HttpClient - one-shot HTTP/1.1 requests over plain TCP or TLS.
 *
 * Every request opens its own connection, which keeps concurrent callers
 * (subnet sweeps, broadcasts) independent of each other. The timeout covers
 * connect, TLS handshake, write and read together.
 *
 * Non-2xx responses are returned as HttpResult; only transport failures
 * become errors (CONNECTION_FAILED, TIMEOUT, INVALID_URL).
 */
class HttpClient {
public:
    explicit HttpClient(net::any_io_executor executor);
    virtual ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // get() and post_json() go through here
    virtual net::awaitable<std::expected<HttpResult, FleetError>> request(
        http::verb method,
        const std::string& url,
        std::string body,
        const std::string& bearer_token,
        std::chrono::milliseconds timeout);

    net::awaitable<std::expected<HttpResult, FleetError>> get(
        const std::string& url,
        const std::string& bearer_token = {},
        std::chrono::milliseconds timeout = std::chrono::seconds(10));

    net::awaitable<std::expected<HttpResult, FleetError>> post_json(
        const std::string& url,
        const boost::json::object& body,
        const std::string& bearer_token = {},
        std::chrono::milliseconds timeout = std::chrono::seconds(10));

private:
    net::any_io_executor executor_;
    ssl::context ssl_ctx_{ssl::context::tlsv12_client};
};

} // namespace voxfleet
