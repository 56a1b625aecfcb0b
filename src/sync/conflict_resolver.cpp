#include "sync/conflict_resolver.hpp"
#include "core/three_way_merge.hpp"

#include <algorithm>
#include <set>

namespace tidesync::sync {

namespace {

// A side has a say on a field if it holds it or stamped its removal.
std::optional<Timestamp> claim(const Entity& entity, const std::string& name) {
    auto it = entity.field_stamps.find(name);
    if (it != entity.field_stamps.end()) return it->second;
    if (entity.field(name)) return entity.last_modified;
    return std::nullopt;
}

} // namespace

std::string_view to_string(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::ServerWins: return "server_wins";
        case ResolutionStrategy::ClientWins: return "client_wins";
        case ResolutionStrategy::MostRecent: return "most_recent";
        case ResolutionStrategy::FieldLevelMerge: return "field_level_merge";
        case ResolutionStrategy::ThreeWayMerge: return "three_way_merge";
        case ResolutionStrategy::Manual: return "manual";
    }
    return "unknown";
}

std::optional<ResolutionStrategy> parse_strategy(std::string_view id) {
    for (auto strategy : {ResolutionStrategy::ServerWins, ResolutionStrategy::ClientWins,
                          ResolutionStrategy::MostRecent, ResolutionStrategy::FieldLevelMerge,
                          ResolutionStrategy::ThreeWayMerge, ResolutionStrategy::Manual}) {
        if (to_string(strategy) == id) return strategy;
    }
    return std::nullopt;
}

std::string_view Resolution::description() const {
    switch (kind) {
        case Kind::UseLocal: return "use_local";
        case Kind::UseRemote: return "use_remote";
        case Kind::Merge: return "merge";
        case Kind::Manual: return "manual";
    }
    return "unknown";
}

Result<Resolution, Error> ConflictResolver::resolve(const Entity& local,
                                                    const Entity& remote,
                                                    const Entity* base) const {
    using R = Result<Resolution, Error>;

    if (local.entity_type.empty() || local.entity_type != remote.entity_type) {
        return R::err(Error{"Cannot resolve '" + local.entity_type + "' against '" +
                                remote.entity_type + "'",
                            ErrorCode::InvalidEntityType});
    }
    if (local.uuid != remote.uuid) {
        return R::err(Error{"Cannot resolve different entities " + local.uuid.to_string() +
                                " and " + remote.uuid.to_string(),
                            ErrorCode::InvalidArguments});
    }

    switch (strategy_) {
        case ResolutionStrategy::ServerWins:
            return R::ok(Resolution{.kind = Resolution::Kind::UseRemote});
        case ResolutionStrategy::ClientWins:
            return R::ok(Resolution{.kind = Resolution::Kind::UseLocal});
        case ResolutionStrategy::MostRecent:
            // Ties go to the server copy.
            return R::ok(Resolution{.kind = local.last_modified > remote.last_modified
                                                ? Resolution::Kind::UseLocal
                                                : Resolution::Kind::UseRemote});
        case ResolutionStrategy::FieldLevelMerge:
            return R::ok(Resolution{.kind = Resolution::Kind::Merge,
                                    .merged = field_level_merge(local, remote)});
        case ResolutionStrategy::ThreeWayMerge:
            return R::ok(three_way(local, remote, base ? *base : local));
        case ResolutionStrategy::Manual:
            return R::ok(Resolution{.kind = Resolution::Kind::Manual});
    }
    return R::err(Error{"Unknown resolution strategy", ErrorCode::InternalError});
}

Entity ConflictResolver::field_level_merge(const Entity& local, const Entity& remote) const {
    Entity merged = local;
    merged.fields.clear();
    merged.field_stamps.clear();
    merged.change_tag = remote.change_tag;
    merged.record_id = local.record_id ? local.record_id : remote.record_id;
    merged.last_modified = std::max(local.last_modified, remote.last_modified);
    merged.created_at = std::min(local.created_at, remote.created_at);

    std::set<std::string> names;
    for (const auto& [name, _] : local.fields) names.insert(name);
    for (const auto& [name, _] : remote.fields) names.insert(name);
    for (const auto& [name, _] : local.field_stamps) names.insert(name);
    for (const auto& [name, _] : remote.field_stamps) names.insert(name);

    static const FieldValue kAbsent{};
    for (const auto& name : names) {
        const auto* l = local.field(name);
        const auto* r = remote.field(name);
        const auto& lv = l ? *l : kAbsent;
        const auto& rv = r ? *r : kAbsent;
        const auto local_stamp = claim(local, name);
        const auto remote_stamp = claim(remote, name);

        FieldValue value;
        if (kind_of(lv) == FieldKind::Instant && kind_of(rv) == FieldKind::Instant) {
            value = std::max(std::get<Timestamp>(lv), std::get<Timestamp>(rv));
        } else if (!remote_stamp) {
            value = lv;
        } else if (!local_stamp) {
            value = rv;
        } else {
            value = *remote_stamp > *local_stamp ? rv : lv;
        }

        if (!std::holds_alternative<std::monostate>(value)) {
            merged.fields.emplace(name, std::move(value));
        }
        merged.field_stamps[name] = std::max(local_stamp.value_or(Timestamp{}),
                                             remote_stamp.value_or(Timestamp{}));
    }
    return merged;
}

Resolution ConflictResolver::three_way(const Entity& local, const Entity& remote, const Entity& base) const {
    auto result = three_way_merge_fields(base.fields, local.fields, remote.fields,
                                         ThreeWayMergeOptions{.ours_modified = local.last_modified,
                                                              .theirs_modified = remote.last_modified});

    Entity merged = local;
    merged.fields = std::move(result.merged);
    merged.change_tag = remote.change_tag;
    merged.record_id = local.record_id ? local.record_id : remote.record_id;
    merged.last_modified = clock_();

    FieldStamps stamps;
    for (const auto& [name, _] : merged.fields) {
        stamps[name] = std::max(local.field_stamp(name), remote.field_stamp(name));
    }
    merged.field_stamps = std::move(stamps);

    return Resolution{.kind = Resolution::Kind::Merge,
                      .merged = std::move(merged),
                      .unresolved_fields = std::move(result.unresolved)};
}

} // namespace tidesync::sync
