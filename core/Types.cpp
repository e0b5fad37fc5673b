#include "Types.hpp"
#include "GeoMath.hpp"
#include <unordered_map>

namespace farmfence {

double Zone::areaHectares() const {
    return GeoMath::polygonAreaHectares(boundary);
}

std::string permissionStateToString(PermissionState state) {
    switch (state) {
        case PermissionState::Unknown: return "unknown";
        case PermissionState::Prompt: return "prompt";
        case PermissionState::Granted: return "granted";
        case PermissionState::Denied: return "denied";
        default: return "unknown";
    }
}

std::string trackingStateToString(TrackingState state) {
    switch (state) {
        case TrackingState::Idle: return "Idle";
        case TrackingState::Requesting: return "Requesting";
        case TrackingState::Active: return "Active";
        case TrackingState::Error: return "Error";
        default: return "Unknown";
    }
}

std::string errorKindToString(ErrorKind kind) {
    static const std::unordered_map<ErrorKind, std::string> kindMap = {
        {ErrorKind::PermissionDenied, "permission_denied"},
        {ErrorKind::PositionUnavailable, "position_unavailable"},
        {ErrorKind::Timeout, "timeout"},
        {ErrorKind::Unsupported, "unsupported"}
    };

    auto it = kindMap.find(kind);
    return (it != kindMap.end()) ? it->second : "unknown";
}

ErrorKind stringToErrorKind(const std::string& str) {
    static const std::unordered_map<std::string, ErrorKind> stringMap = {
        {"permission_denied", ErrorKind::PermissionDenied},
        {"denied", ErrorKind::PermissionDenied},
        {"position_unavailable", ErrorKind::PositionUnavailable},
        {"unavailable", ErrorKind::PositionUnavailable},
        {"timeout", ErrorKind::Timeout},
        {"unsupported", ErrorKind::Unsupported}
    };

    auto it = stringMap.find(str);
    return (it != stringMap.end()) ? it->second : ErrorKind::PositionUnavailable;
}

} // namespace farmfence
