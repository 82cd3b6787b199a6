#pragma once

#include <cstdint>
#include <string>

namespace voxfleet {

// ============================================================================
// Fleet Errors
// ============================================================================

enum class FleetError : uint16_t {
    // Exit / transfer
    NO_DEVICES_AVAILABLE = 1001,
    NO_FEDERATED_SERVERS_AVAILABLE = 1002,
    TRANSFER_FAILED = 1003,

    // Remote control
    DISCOVERY_TIMEOUT = 2001,
    CHANNEL_UNAVAILABLE = 2002,
    PERMISSION_DENIED = 2003,
    INVALID_PARAMETERS = 2004,
    INVALID_URL = 2005,

    // Transport
    CONNECTION_FAILED = 3001,
    TIMEOUT = 3002,
    HTTP_STATUS = 3003,
    MALFORMED_RESPONSE = 3004,
};

std::string fleet_error_message(FleetError error);
const char* fleet_error_name(FleetError error);

} // namespace voxfleet
