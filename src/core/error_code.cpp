#include "core/error_code.hpp"

namespace tidesync {

bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkUnavailable:
        case ErrorCode::NetworkFailure:
        case ErrorCode::ServiceUnavailable:
        case ErrorCode::RateLimited:
        case ErrorCode::ZoneBusy:
        case ErrorCode::ServerResponseLost:
            return true;
        default:
            return false;
    }
}

bool is_conflict(ErrorCode code) noexcept {
    return code == ErrorCode::ServerRecordChanged;
}

std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkUnavailable: return "network_unavailable";
        case ErrorCode::NetworkFailure: return "network_failure";
        case ErrorCode::ServiceUnavailable: return "service_unavailable";
        case ErrorCode::RateLimited: return "rate_limited";
        case ErrorCode::ZoneBusy: return "zone_busy";
        case ErrorCode::ServerResponseLost: return "server_response_lost";
        case ErrorCode::InternalError: return "internal_error";
        case ErrorCode::ServerRejectedRequest: return "server_rejected_request";
        case ErrorCode::InvalidArguments: return "invalid_arguments";
        case ErrorCode::UnknownItem: return "unknown_item";
        case ErrorCode::PermissionFailure: return "permission_failure";
        case ErrorCode::QuotaExceeded: return "quota_exceeded";
        case ErrorCode::InvalidEntityType: return "invalid_entity_type";
        case ErrorCode::StorageError: return "storage_error";
        case ErrorCode::DataCorruption: return "data_corruption";
        case ErrorCode::ServerRecordChanged: return "server_record_changed";
        case ErrorCode::ChangeTokenExpired: return "change_token_expired";
        case ErrorCode::ZoneNotFound: return "zone_not_found";
        case ErrorCode::AuthenticationRequired: return "authentication_required";
        case ErrorCode::AlreadySyncing: return "already_syncing";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace tidesync
