#include "core/three_way_merge.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <set>

namespace tidesync {
namespace {

const FieldValue& lookup(const FieldMap& fields, const std::string& name) {
    static const FieldValue kAbsent{};
    auto it = fields.find(name);
    return it == fields.end() ? kAbsent : it->second;
}

template<typename T>
struct ScalarMerge {
    T value;
    bool unresolved{false};
};

// Only-one-side-changed rule shared by plain fields and measurement entries.
template<typename T>
ScalarMerge<T> merge_scalar(const T& base, const T& ours, const T& theirs) {
    if (ours == base) return {theirs};
    if (theirs == base) return {ours};
    if (ours == theirs) return {ours};
    return {base, true};
}

TagSet as_tags(const FieldValue& value) {
    if (const auto* tags = std::get_if<TagSet>(&value)) return *tags;
    return {};
}

TagSet merge_tags(const FieldValue& base, const FieldValue& ours, const FieldValue& theirs) {
    const auto b = as_tags(base);
    TagSet merged = b;
    for (const auto* side : {&ours, &theirs}) {
        for (const auto& tag : as_tags(*side)) {
            if (b.count(tag) == 0) merged.insert(tag);
        }
    }
    return merged;
}

std::optional<double> reading(const FieldValue& value, const std::string& key) {
    const auto* readings = std::get_if<MeasurementMap>(&value);
    if (!readings) return std::nullopt;
    auto it = readings->find(key);
    if (it == readings->end()) return std::nullopt;
    return it->second;
}

MeasurementMap merge_measurements(const std::string& field,
                                  const FieldValue& base,
                                  const FieldValue& ours,
                                  const FieldValue& theirs,
                                  std::vector<std::string>& unresolved) {
    std::set<std::string> keys;
    for (const auto* side : {&base, &ours, &theirs}) {
        if (const auto* readings = std::get_if<MeasurementMap>(side)) {
            for (const auto& [key, _] : *readings) keys.insert(key);
        }
    }

    MeasurementMap merged;
    for (const auto& key : keys) {
        auto r = merge_scalar(reading(base, key), reading(ours, key), reading(theirs, key));
        if (r.unresolved) unresolved.push_back(field + "." + key);
        if (r.value) merged[key] = *r.value;
    }
    return merged;
}

bool near(const FieldValue& a, const FieldValue& b, double tolerance) {
    const auto* p = std::get_if<GeoPoint>(&a);
    const auto* q = std::get_if<GeoPoint>(&b);
    if (!p || !q) return a == b;
    return std::abs(p->latitude - q->latitude) <= tolerance && std::abs(p->longitude - q->longitude) <= tolerance;
}

FieldValue merge_location(const FieldValue& base,
                          const FieldValue& ours,
                          const FieldValue& theirs,
                          const ThreeWayMergeOptions& options) {
    const bool ours_moved = !near(base, ours, options.coordinate_degrees);
    const bool theirs_moved = !near(base, theirs, options.coordinate_degrees);
    if (ours_moved && theirs_moved) {
        if (near(ours, theirs, options.coordinate_degrees)) return ours;
        return options.ours_modified > options.theirs_modified ? ours : theirs;
    }
    if (ours_moved) return ours;
    if (theirs_moved) return theirs;
    return base;
}

bool is_kind(const FieldValue& value, FieldKind kind) {
    return kind_of(value) == kind;
}

bool any_side_is(FieldKind kind, const FieldValue& b, const FieldValue& o, const FieldValue& t) {
    return is_kind(b, kind) || is_kind(o, kind) || is_kind(t, kind);
}

// Tag and measurement merges apply only when no side holds a different kind.
bool all_sides_are_or_empty(FieldKind kind, const FieldValue& b, const FieldValue& o, const FieldValue& t) {
    for (const auto* v : {&b, &o, &t}) {
        const auto k = kind_of(*v);
        if (k != kind && k != FieldKind::Empty) return false;
    }
    return true;
}

} // namespace

ThreeWayMergeResult three_way_merge_fields(const FieldMap& base,
                                           const FieldMap& ours,
                                           const FieldMap& theirs,
                                           const ThreeWayMergeOptions& options) {
    std::set<std::string> names;
    for (const auto* fields : {&base, &ours, &theirs}) {
        for (const auto& [name, _] : *fields) names.insert(name);
    }

    ThreeWayMergeResult result;
    for (const auto& name : names) {
        const auto& b = lookup(base, name);
        const auto& o = lookup(ours, name);
        const auto& t = lookup(theirs, name);

        FieldValue merged;
        if (any_side_is(FieldKind::Tags, b, o, t) && all_sides_are_or_empty(FieldKind::Tags, b, o, t)) {
            auto tags = merge_tags(b, o, t);
            if (!tags.empty()) merged = std::move(tags);
        } else if (any_side_is(FieldKind::Measurements, b, o, t) &&
                   all_sides_are_or_empty(FieldKind::Measurements, b, o, t)) {
            auto readings = merge_measurements(name, b, o, t, result.unresolved);
            if (!readings.empty()) merged = std::move(readings);
        } else if (any_side_is(FieldKind::Geo, b, o, t) && all_sides_are_or_empty(FieldKind::Geo, b, o, t)) {
            merged = merge_location(b, o, t, options);
        } else {
            auto r = merge_scalar(b, o, t);
            if (r.unresolved && is_kind(o, FieldKind::Instant) && is_kind(t, FieldKind::Instant)) {
                merged = std::max(std::get<Timestamp>(o), std::get<Timestamp>(t));
            } else {
                if (r.unresolved) result.unresolved.push_back(name);
                merged = std::move(r.value);
            }
        }

        if (!std::holds_alternative<std::monostate>(merged)) {
            result.merged.emplace(name, std::move(merged));
        }
    }

    result.kind = result.unresolved.empty() ? ThreeWayMergeResult::Kind::Clean
                                            : ThreeWayMergeResult::Kind::Conflict;
    return result;
}

} // namespace tidesync
