#include "common/errors.hpp"

namespace voxfleet {

std::string fleet_error_message(FleetError error) {
    switch (error) {
        case FleetError::NO_DEVICES_AVAILABLE: return "No other online devices available";
        case FleetError::NO_FEDERATED_SERVERS_AVAILABLE: return "No federated servers available";
        case FleetError::TRANSFER_FAILED: return "Transfer failed";
        case FleetError::DISCOVERY_TIMEOUT: return "Could not discover device on local network";
        case FleetError::CHANNEL_UNAVAILABLE: return "Failed to establish relay channel";
        case FleetError::PERMISSION_DENIED: return "Permission denied for remote command";
        case FleetError::INVALID_PARAMETERS: return "Invalid command parameters";
        case FleetError::INVALID_URL: return "Invalid device URL";
        case FleetError::CONNECTION_FAILED: return "Connection failed";
        case FleetError::TIMEOUT: return "Request timed out";
        case FleetError::HTTP_STATUS: return "Unexpected HTTP status";
        case FleetError::MALFORMED_RESPONSE: return "Malformed response";
        default: return "Unknown error";
    }
}

const char* fleet_error_name(FleetError error) {
    switch (error) {
        case FleetError::NO_DEVICES_AVAILABLE: return "NO_DEVICES_AVAILABLE";
        case FleetError::NO_FEDERATED_SERVERS_AVAILABLE: return "NO_FEDERATED_SERVERS_AVAILABLE";
        case FleetError::TRANSFER_FAILED: return "TRANSFER_FAILED";
        case FleetError::DISCOVERY_TIMEOUT: return "DISCOVERY_TIMEOUT";
        case FleetError::CHANNEL_UNAVAILABLE: return "CHANNEL_UNAVAILABLE";
        case FleetError::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case FleetError::INVALID_PARAMETERS: return "INVALID_PARAMETERS";
        case FleetError::INVALID_URL: return "INVALID_URL";
        case FleetError::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case FleetError::TIMEOUT: return "TIMEOUT";
        case FleetError::HTTP_STATUS: return "HTTP_STATUS";
        case FleetError::MALFORMED_RESPONSE: return "MALFORMED_RESPONSE";
        default: return "UNKNOWN";
    }
}

} // namespace voxfleet
