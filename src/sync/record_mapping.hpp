#pragma once

#include "core/entity.hpp"
#include "remote/remote_store.hpp"

#include <string>
#include <vector>

namespace tidesync::sync {

// Record names are the entity uuid, so a record can be created before the
// first upload assigned anything.
[[nodiscard]] std::string record_id_for(const Entity& entity);

[[nodiscard]] remote::RemoteRecord to_remote_record(const Entity& entity);

/**
 * Local view of a remote record. With `existing`, the local identity and
 * creation time are kept; the result is always Synced and unflagged.
 */
[[nodiscard]] Entity entity_from_remote(const remote::RemoteRecord& record, const Entity* existing = nullptr);

/**
 * Field names whose value differs between `current` and `base`, sorted.
 * Without a base every field of `current` is changed.
 */
[[nodiscard]] std::vector<std::string> changed_keys(const Entity& current, const Entity* base);

} // namespace tidesync::sync
