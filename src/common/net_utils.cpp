#include "common/net_utils.hpp"
#include "common/log.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/url.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#endif

namespace voxfleet {

namespace {

const log::Logger& logger() { return log::Logger::get("common.net"); }

uint16_t default_port(std::string_view scheme) {
    if (scheme == "https" || scheme == "wss") return 443;
    return 80;
}

} // anonymous namespace

std::string UrlParts::origin() const {
    std::string out = scheme + "://" + host;
    if (has_port) {
        out += ":" + std::to_string(port);
    }
    return out;
}

std::expected<UrlParts, FleetError> parse_url(std::string_view url) {
    auto parsed = boost::urls::parse_uri(url);
    if (!parsed) {
        return std::unexpected(FleetError::INVALID_URL);
    }

    const auto& u = *parsed;
    UrlParts parts;
    parts.scheme = std::string(u.scheme());
    std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (parts.scheme != "http" && parts.scheme != "https" &&
        parts.scheme != "ws" && parts.scheme != "wss") {
        return std::unexpected(FleetError::INVALID_URL);
    }

    parts.host = std::string(u.encoded_host());
    if (parts.host.empty()) {
        return std::unexpected(FleetError::INVALID_URL);
    }
    // [::1] -> ::1 for the resolver
    if (parts.host.size() >= 2 && parts.host.front() == '[' && parts.host.back() == ']') {
        parts.host = parts.host.substr(1, parts.host.size() - 2);
    }

    parts.use_ssl = (parts.scheme == "https" || parts.scheme == "wss");
    if (u.has_port()) {
        auto p = u.port_number();
        if (p == 0) {
            return std::unexpected(FleetError::INVALID_URL);
        }
        parts.port = p;
        parts.has_port = true;
    } else {
        parts.port = default_port(parts.scheme);
    }

    std::string target(u.encoded_path());
    if (target.empty()) {
        target = "/";
    }
    if (u.has_query()) {
        target += "?";
        target += std::string(u.encoded_query());
    }
    parts.target = std::move(target);

    return parts;
}

std::string join_url(std::string_view base, std::string_view path) {
    std::string out(base);
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    if (!path.empty() && path.front() != '/') {
        out += '/';
    }
    out += path;
    return out;
}

std::expected<std::string, FleetError> to_websocket_url(std::string_view url) {
    auto parts = parse_url(url);
    if (!parts) {
        return std::unexpected(parts.error());
    }

    UrlParts ws = *parts;
    if (ws.scheme == "http") ws.scheme = "ws";
    else if (ws.scheme == "https") ws.scheme = "wss";

    std::string out = ws.origin();
    if (ws.target != "/") {
        out += ws.target;
    }
    return out;
}

bool is_ipv4_literal(std::string_view host) {
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(std::string(host), ec);
    return !ec;
}

bool is_private_address(std::string_view host) {
    if (host == "localhost") {
        return true;
    }

    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(std::string(host), ec);
    if (ec) {
        return false;
    }

    auto b = addr.to_bytes();
    if (b[0] == 10) return true;
    if (b[0] == 127) return true;
    if (b[0] == 172 && b[1] >= 16 && b[1] <= 31) return true;
    if (b[0] == 192 && b[1] == 168) return true;
    return false;
}

std::vector<std::string> local_ipv4_prefixes() {
    std::vector<std::string> prefixes;

#ifndef _WIN32
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        logger().warn("getifaddrs failed: {}", std::strerror(errno));
        return prefixes;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_addr->sa_family != AF_INET) continue;

        // Skip loopback and interfaces that are down
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;
        if (!(ifa->ifa_flags & IFF_UP)) continue;
        if (!(ifa->ifa_flags & IFF_RUNNING)) continue;

        auto* addr = reinterpret_cast<struct sockaddr_in*>(ifa->ifa_addr);
        char ip_str[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &addr->sin_addr, ip_str, sizeof(ip_str));

        std::string ip = ip_str;
        if (ip.rfind("169.254", 0) == 0) continue;

        auto last_dot = ip.rfind('.');
        if (last_dot == std::string::npos) continue;
        auto prefix = ip.substr(0, last_dot);

        logger().debug("Local interface {} has {}", ifa->ifa_name, ip);
        if (std::find(prefixes.begin(), prefixes.end(), prefix) == prefixes.end()) {
            prefixes.push_back(std::move(prefix));
        }
    }

    freeifaddrs(ifaddr);
#endif

    return prefixes;
}

} // namespace voxfleet
