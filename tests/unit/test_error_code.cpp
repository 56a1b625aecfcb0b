#include <catch2/catch_test_macros.hpp>
#include "core/error_code.hpp"

using namespace tidesync;

TEST_CASE("Transient codes are the retryable ones", "[unit][errors]") {
    for (auto code : {ErrorCode::NetworkUnavailable, ErrorCode::NetworkFailure, ErrorCode::ServiceUnavailable,
                      ErrorCode::RateLimited, ErrorCode::ZoneBusy, ErrorCode::ServerResponseLost}) {
        INFO(to_string(code));
        REQUIRE(is_transient(code));
        REQUIRE_FALSE(is_conflict(code));
    }

    for (auto code : {ErrorCode::InternalError, ErrorCode::ServerRejectedRequest, ErrorCode::InvalidArguments,
                      ErrorCode::UnknownItem, ErrorCode::PermissionFailure, ErrorCode::QuotaExceeded,
                      ErrorCode::InvalidEntityType, ErrorCode::StorageError, ErrorCode::DataCorruption,
                      ErrorCode::ChangeTokenExpired, ErrorCode::ZoneNotFound, ErrorCode::AuthenticationRequired,
                      ErrorCode::AlreadySyncing, ErrorCode::Cancelled}) {
        INFO(to_string(code));
        REQUIRE_FALSE(is_transient(code));
        REQUIRE_FALSE(is_conflict(code));
    }
}

TEST_CASE("A stale change tag is a conflict, not a failure", "[unit][errors]") {
    REQUIRE(is_conflict(ErrorCode::ServerRecordChanged));
    REQUIRE_FALSE(is_transient(ErrorCode::ServerRecordChanged));
}

TEST_CASE("Error codes have stable names", "[unit][errors]") {
    REQUIRE(to_string(ErrorCode::ServerRecordChanged) == "server_record_changed");
    REQUIRE(to_string(ErrorCode::ChangeTokenExpired) == "change_token_expired");
    REQUIRE(to_string(ErrorCode::ZoneNotFound) == "zone_not_found");
    REQUIRE(to_string(ErrorCode::RateLimited) == "rate_limited");
}
