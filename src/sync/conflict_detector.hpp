#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace tidesync::sync {

struct DetectionTolerances {
    double coordinate_degrees{0.0001};  // about 10 m
    std::chrono::milliseconds instant{std::chrono::seconds(60)};
};

struct ConflictReport {
    bool has_conflict{false};
    std::vector<std::string> conflicting_fields;  // sorted by name
};

/**
 * ConflictDetector - decides whether two versions of the same entity
 * really disagree.
 *
 * Fields are compared by the kind of value they hold:
 *   tags          - sets must be equal
 *   text, number  - must be equal
 *   geo           - each axis within coordinate_degrees
 *   measurements  - every key present on both sides with the same reading
 *   instant       - within `instant` of each other; absent on either side
 *                   is not a conflict
 * A field present on one side only is a conflict (except instants), as is
 * a field holding different kinds on each side. Sync metadata is ignored.
 */
class ConflictDetector {
public:
    explicit ConflictDetector(DetectionTolerances tolerances = {}) : tolerances_(tolerances) {}

    /**
     * Fails with InvalidArguments when the two versions are different
     * entities (uuid mismatch).
     */
    [[nodiscard]] Result<ConflictReport, Error> detect(const Entity& local, const Entity& remote) const;

    [[nodiscard]] bool values_conflict(const FieldValue& local, const FieldValue& remote) const;

    [[nodiscard]] const DetectionTolerances& tolerances() const { return tolerances_; }

private:
    DetectionTolerances tolerances_;
};

} // namespace tidesync::sync
