#include "node/http_router.hpp"

namespace voxfleet::node {

namespace {

std::string_view strip_query(std::string_view target) {
    auto q = target.find('?');
    return q == std::string_view::npos ? target : target.substr(0, q);
}

} // anonymous namespace

// ============================================================================
// JSON Response Helpers
// ============================================================================

HttpResponse make_json_response(http::status status, const boost::json::value& body, unsigned version) {
    HttpResponse res{status, version};
    res.set(http::field::server, "VoxFleet Node");
    res.set(http::field::content_type, "application/json");
    res.body() = boost::json::serialize(body);
    res.prepare_payload();
    return res;
}

HttpResponse make_error_response(http::status status, const std::string& error, unsigned version) {
    boost::json::object body;
    body["success"] = false;
    body["error"] = error;
    return make_json_response(status, body, version);
}

// ============================================================================
// HttpRouter Implementation
// ============================================================================

void HttpRouter::add_route(http::verb method, const std::string& pattern, RouteHandler handler) {
    Route route;
    route.method = method;
    route.pattern = pattern;
    route.handler = std::move(handler);
    route.is_pattern = pattern.find(':') != std::string::npos;
    routes_.push_back(std::move(route));
}

std::pair<RouteHandler, std::string> HttpRouter::find_route(http::verb method, std::string_view target) const {
    auto path = strip_query(target);

    for (const auto& route : routes_) {
        if (route.method != method) continue;

        if (route.is_pattern) {
            std::string param;
            if (match_pattern(route.pattern, path, param)) {
                return {route.handler, param};
            }
        } else if (route.pattern == path) {
            return {route.handler, ""};
        }
    }

    return {nullptr, ""};
}

bool HttpRouter::has_path(std::string_view target) const {
    auto path = strip_query(target);
    for (const auto& route : routes_) {
        std::string param;
        if (route.is_pattern ? match_pattern(route.pattern, path, param) : route.pattern == path) {
            return true;
        }
    }
    return false;
}

bool HttpRouter::match_pattern(const std::string& pattern, std::string_view path, std::string& param) {
    // /api/rooms/:id/pause -> prefix "/api/rooms/", suffix "/pause"
    size_t colon_pos = pattern.find(':');
    if (colon_pos == std::string::npos) return false;

    std::string_view prefix(pattern.data(), colon_pos);
    size_t suffix_pos = pattern.find('/', colon_pos);
    std::string_view suffix = suffix_pos == std::string::npos
        ? std::string_view{}
        : std::string_view(pattern).substr(suffix_pos);

    if (path.size() < prefix.size() + suffix.size()) return false;
    if (path.substr(0, prefix.size()) != prefix) return false;
    if (path.substr(path.size() - suffix.size()) != suffix) return false;

    auto value = path.substr(prefix.size(), path.size() - prefix.size() - suffix.size());
    if (value.empty() || value.find('/') != std::string_view::npos) return false;

    param = std::string(value);
    return true;
}

} // namespace voxfleet::node
