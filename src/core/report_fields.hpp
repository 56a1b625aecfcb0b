#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace tidesync::report {

inline constexpr const char* kEntityType = "report";

inline constexpr const char* kSpecies = "species";                        // tags
inline constexpr const char* kIntensity = "intensity";                    // text
inline constexpr const char* kLocation = "location";                      // geo
inline constexpr const char* kNotes = "notes";                            // text
inline constexpr const char* kEnvironment = "environment";                // measurements
inline constexpr const char* kTimestamp = "timestamp";                    // instant
inline constexpr const char* kUserId = "user_id";                         // text
inline constexpr const char* kVerificationStatus = "verification_status"; // text

/**
 * Kind a report field is expected to hold. Unknown names are text.
 */
[[nodiscard]] FieldKind field_kind(std::string_view name);

/**
 * Parse a command line assignment "name=value" using the report schema:
 *   species=blue crab,shrimp
 *   location=30.6954,-88.0399
 *   environment=water_temp:28.5,salinity:12
 *   timestamp=2024-07-04T05:30:00Z   (or milliseconds since epoch)
 *   intensity=Major
 * An empty value clears the field.
 */
[[nodiscard]] Result<std::pair<std::string, FieldValue>, Error> parse_assignment(std::string_view text);

/**
 * Human readable rendering of a value, the inverse of parse_assignment's
 * value syntax.
 */
[[nodiscard]] std::string format_value(const FieldValue& value);

} // namespace tidesync::report
