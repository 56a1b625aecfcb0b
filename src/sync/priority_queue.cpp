#include "sync/priority_queue.hpp"

#include <algorithm>

namespace tidesync::sync {

std::string_view to_string(SyncPriority priority) {
    switch (priority) {
        case SyncPriority::UserInitiated: return "user_initiated";
        case SyncPriority::High: return "high";
        case SyncPriority::Normal: return "normal";
        case SyncPriority::Low: return "low";
    }
    return "normal";
}

size_t SyncPriorityQueue::tier_index(SyncPriority priority) noexcept {
    switch (priority) {
        case SyncPriority::UserInitiated:
        case SyncPriority::High:
            return 0;
        case SyncPriority::Normal:
            return 1;
        case SyncPriority::Low:
            return 2;
    }
    return 1;
}

void SyncPriorityQueue::erase_from_tier(size_t tier, const Uuid& uuid) {
    auto& queue = tiers_[tier];
    queue.erase(std::remove_if(queue.begin(), queue.end(),
                               [&](const QueuedEntity& e) { return e.uuid == uuid; }),
                queue.end());
}

void SyncPriorityQueue::take_from_tier(size_t tier, size_t count, std::vector<QueuedEntity>& out) {
    auto& queue = tiers_[tier];
    while (out.size() < count && !queue.empty()) {
        out.push_back(queue.front());
        index_.erase(queue.front().uuid);
        queue.pop_front();
    }
}

void SyncPriorityQueue::enqueue(const Uuid& uuid, SyncPriority priority) {
    std::lock_guard lock(mutex_);
    const size_t tier = tier_index(priority);

    auto it = index_.find(uuid);
    if (it != index_.end()) {
        if (it->second <= tier) {
            return;
        }
        erase_from_tier(it->second, uuid);
        it->second = tier;
    } else {
        index_.emplace(uuid, tier);
    }
    tiers_[tier].push_back(QueuedEntity{.uuid = uuid, .priority = priority});
}

std::vector<QueuedEntity> SyncPriorityQueue::dequeue_batch(size_t count) {
    std::lock_guard lock(mutex_);
    std::vector<QueuedEntity> out;
    out.reserve(std::min(count, index_.size()));
    for (size_t tier = 0; tier < kTierCount && out.size() < count; ++tier) {
        take_from_tier(tier, count, out);
    }
    return out;
}

std::vector<QueuedEntity> SyncPriorityQueue::dequeue_tier(SyncPriority tier, size_t count) {
    std::lock_guard lock(mutex_);
    std::vector<QueuedEntity> out;
    take_from_tier(tier_index(tier), count, out);
    return out;
}

bool SyncPriorityQueue::remove(const Uuid& uuid) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(uuid);
    if (it == index_.end()) {
        return false;
    }
    erase_from_tier(it->second, uuid);
    index_.erase(it);
    return true;
}

void SyncPriorityQueue::clear() {
    std::lock_guard lock(mutex_);
    for (auto& queue : tiers_) {
        queue.clear();
    }
    index_.clear();
}

bool SyncPriorityQueue::contains(const Uuid& uuid) const {
    std::lock_guard lock(mutex_);
    return index_.count(uuid) != 0;
}

std::optional<SyncPriority> SyncPriorityQueue::priority_of(const Uuid& uuid) const {
    std::lock_guard lock(mutex_);
    auto it = index_.find(uuid);
    if (it == index_.end()) {
        return std::nullopt;
    }
    for (const auto& entry : tiers_[it->second]) {
        if (entry.uuid == uuid) return entry.priority;
    }
    return std::nullopt;
}

size_t SyncPriorityQueue::size() const {
    std::lock_guard lock(mutex_);
    return index_.size();
}

size_t SyncPriorityQueue::size(SyncPriority tier) const {
    std::lock_guard lock(mutex_);
    return tiers_[tier_index(tier)].size();
}

} // namespace tidesync::sync
