#pragma once

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tidesync::sync {

/**
 * SyncPriority - processing order of pending entities.
 * UserInitiated shares the high tier.
 */
enum class SyncPriority {
    UserInitiated,
    High,
    Normal,
    Low
};

[[nodiscard]] std::string_view to_string(SyncPriority priority);

struct QueuedEntity {
    Uuid uuid;
    SyncPriority priority{SyncPriority::Normal};

    bool operator==(const QueuedEntity&) const = default;
};

/**
 * SyncPriorityQueue - three-tier in-memory queue of entities awaiting
 * upload.
 *
 * Tiers drain strictly in order: high before normal before low. An entity
 * is queued at most once; re-enqueueing at a higher tier promotes it,
 * re-enqueueing at the same or a lower tier is a no-op. All operations
 * take the internal mutex and never block on anything else.
 */
class SyncPriorityQueue {
public:
    SyncPriorityQueue() = default;

    SyncPriorityQueue(const SyncPriorityQueue&) = delete;
    SyncPriorityQueue& operator=(const SyncPriorityQueue&) = delete;

    void enqueue(const Uuid& uuid, SyncPriority priority);

    /**
     * Remove and return up to `count` entries, highest tier first, FIFO
     * within a tier.
     */
    [[nodiscard]] std::vector<QueuedEntity> dequeue_batch(size_t count);

    /**
     * Remove and return up to `count` entries from one tier only.
     */
    [[nodiscard]] std::vector<QueuedEntity> dequeue_tier(SyncPriority tier, size_t count);

    /**
     * Drop an entity from whichever tier holds it. Returns false if absent.
     */
    bool remove(const Uuid& uuid);

    void clear();

    [[nodiscard]] bool contains(const Uuid& uuid) const;
    [[nodiscard]] std::optional<SyncPriority> priority_of(const Uuid& uuid) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t size(SyncPriority tier) const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    static constexpr size_t kTierCount = 3;

    [[nodiscard]] static size_t tier_index(SyncPriority priority) noexcept;
    void erase_from_tier(size_t tier, const Uuid& uuid);
    void take_from_tier(size_t tier, size_t count, std::vector<QueuedEntity>& out);

    mutable std::mutex mutex_;
    std::array<std::deque<QueuedEntity>, kTierCount> tiers_;
    std::unordered_map<Uuid, size_t> index_;  // uuid -> tier
};

} // namespace tidesync::sync
