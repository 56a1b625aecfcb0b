#pragma once

#include <string_view>

namespace tidesync {

/**
 * ErrorCode - classification of every failure the sync engine can report.
 *
 * The classification drives policy: transient codes are retried with
 * backoff, ServerRecordChanged is routed to the conflict resolver, and the
 * recovery codes trigger a watermark reset or zone recreation.
 */
enum class ErrorCode {
    // transient
    NetworkUnavailable,
    NetworkFailure,
    ServiceUnavailable,
    RateLimited,
    ZoneBusy,
    ServerResponseLost,

    // non-retryable
    InternalError,
    ServerRejectedRequest,
    InvalidArguments,
    UnknownItem,
    PermissionFailure,
    QuotaExceeded,
    InvalidEntityType,
    StorageError,
    DataCorruption,

    // conflict
    ServerRecordChanged,

    // recovery
    ChangeTokenExpired,
    ZoneNotFound,

    // cycle control
    AuthenticationRequired,
    AlreadySyncing,
    Cancelled
};

[[nodiscard]] bool is_transient(ErrorCode code) noexcept;
[[nodiscard]] bool is_conflict(ErrorCode code) noexcept;
[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

} // namespace tidesync
