#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace voxfleet::node {

namespace http = boost::beast::http;

// ============================================================================
// HTTP Request Handler Types
// ============================================================================

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Second argument is the ":param" segment of the matched route, empty otherwise
using RouteHandler = std::function<HttpResponse(const HttpRequest&, const std::string&)>;

// ============================================================================
// HTTP Router
// ============================================================================

class HttpRouter {
public:
    void add_route(http::verb method, const std::string& pattern, RouteHandler handler);

    // {nullptr, ""} when nothing matches; the query string is ignored
    std::pair<RouteHandler, std::string> find_route(http::verb method, std::string_view target) const;

    // True when some route has this path under another method
    bool has_path(std::string_view target) const;

    static bool match_pattern(const std::string& pattern, std::string_view path, std::string& param);

private:
    struct Route {
        http::verb method;
        std::string pattern;
        RouteHandler handler;
        bool is_pattern{false};  // Has a path parameter like :id
    };

    std::vector<Route> routes_;
};

// ============================================================================
// JSON Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const boost::json::value& body, unsigned version = 11);
HttpResponse make_error_response(http::status status, const std::string& error, unsigned version = 11);

} // namespace voxfleet::node
