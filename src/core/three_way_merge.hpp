#pragma once

#include "core/entity.hpp"

#include <string>
#include <vector>

namespace tidesync {

struct ThreeWayMergeResult {
    enum class Kind {
        Clean,
        Conflict
    };

    Kind kind{Kind::Clean};
    FieldMap merged;
    // Field names (or "field.key" for measurement entries) changed to
    // different values on both sides; they keep the base value.
    std::vector<std::string> unresolved;

    [[nodiscard]] bool clean() const { return kind == Kind::Clean; }
};

struct ThreeWayMergeOptions {
    // Geo points closer than this on both axes count as unchanged.
    double coordinate_degrees{0.0001};
    // Entity modification times; a location moved on both sides goes to the
    // later one, ties to theirs.
    Timestamp ours_modified{};
    Timestamp theirs_modified{};
};

// Deterministic field-level 3-way merge against a common ancestor:
// - tag sets: base plus everything either side added
// - measurement maps: key by key, with the scalar rule below
// - instants changed on both sides: the later instant
// - geo points: changed only beyond the coordinate tolerance; moved on
//   both sides, the more recently modified side wins
// - everything else: take the side that changed; equal changes agree;
//   different changes keep the base value and are reported unresolved
[[nodiscard]] ThreeWayMergeResult three_way_merge_fields(const FieldMap& base,
                                                         const FieldMap& ours,
                                                         const FieldMap& theirs,
                                                         const ThreeWayMergeOptions& options = {});

} // namespace tidesync
