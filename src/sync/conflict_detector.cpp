#include "sync/conflict_detector.hpp"

#include <cmath>
#include <set>

namespace tidesync::sync {

bool ConflictDetector::values_conflict(const FieldValue& local, const FieldValue& remote) const {
    const auto local_kind = kind_of(local);
    const auto remote_kind = kind_of(remote);

    if (local_kind == FieldKind::Empty && remote_kind == FieldKind::Empty) {
        return false;
    }
    if (local_kind == FieldKind::Empty || remote_kind == FieldKind::Empty) {
        // An instant known on only one side carries no disagreement.
        return local_kind != FieldKind::Instant && remote_kind != FieldKind::Instant;
    }
    if (local_kind != remote_kind) {
        return true;
    }

    switch (local_kind) {
        case FieldKind::Geo: {
            const auto& a = std::get<GeoPoint>(local);
            const auto& b = std::get<GeoPoint>(remote);
            return std::abs(a.latitude - b.latitude) > tolerances_.coordinate_degrees ||
                   std::abs(a.longitude - b.longitude) > tolerances_.coordinate_degrees;
        }
        case FieldKind::Instant: {
            const auto delta = std::get<Timestamp>(local) - std::get<Timestamp>(remote);
            return std::chrono::abs(delta) > tolerances_.instant;
        }
        default:
            return local != remote;
    }
}

Result<ConflictReport, Error> ConflictDetector::detect(const Entity& local, const Entity& remote) const {
    if (local.uuid != remote.uuid) {
        return Result<ConflictReport, Error>::err(Error{
            "Cannot compare different entities " + local.uuid.to_string() + " and " + remote.uuid.to_string(),
            ErrorCode::InvalidArguments});
    }

    std::set<std::string> names;
    for (const auto& [name, _] : local.fields) names.insert(name);
    for (const auto& [name, _] : remote.fields) names.insert(name);

    static const FieldValue kAbsent{};
    ConflictReport report;
    for (const auto& name : names) {
        const auto* l = local.field(name);
        const auto* r = remote.field(name);
        if (values_conflict(l ? *l : kAbsent, r ? *r : kAbsent)) {
            report.conflicting_fields.push_back(name);
        }
    }
    report.has_conflict = !report.conflicting_fields.empty();
    return Result<ConflictReport, Error>::ok(std::move(report));
}

} // namespace tidesync::sync
