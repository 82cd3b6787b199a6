#pragma once

#include "common/errors.hpp"
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace voxfleet {

// ============================================================================
// URL handling
// ============================================================================

struct UrlParts {
    std::string scheme;   // "http", "https", "ws", "wss"
    std::string host;
    uint16_t port{0};     // Explicit port or scheme default
    bool has_port{false};
    std::string target{"/"};
    bool use_ssl{false};

    // scheme://host[:port] without path
    std::string origin() const;
};

// Parses http(s) and ws(s) URLs; anything else is INVALID_URL
std::expected<UrlParts, FleetError> parse_url(std::string_view url);

// Append a path to a base URL, collapsing the joining slash
std::string join_url(std::string_view base, std::string_view path);

// http -> ws, https -> wss; keeps host, port and path
std::expected<std::string, FleetError> to_websocket_url(std::string_view url);

// ============================================================================
// Addresses
// ============================================================================

// RFC 1918 ranges, loopback and "localhost"
bool is_private_address(std::string_view host);

// True for a dotted-quad IPv4 literal
bool is_ipv4_literal(std::string_view host);

// First three octets of each up, non-loopback, non-link-local IPv4 interface
std::vector<std::string> local_ipv4_prefixes();

} // namespace voxfleet
