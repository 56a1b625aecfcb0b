#include "remote/memory_record_store.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace tidesync::remote {

MemoryRecordStore::MemoryRecordStore(std::string id, Clock clock)
    : id_(std::move(id)), clock_(std::move(clock)) {}

std::string MemoryRecordStore::candidate_tag() const {
    return "tag-" + std::to_string(tag_counter_ + 1);
}

Timestamp MemoryRecordStore::candidate_modified_at() const {
    // Strictly increasing so that a watermark never skips a record.
    const auto now = clock_();
    return now > last_modified_at_ ? now : last_modified_at_ + std::chrono::milliseconds(1);
}

void MemoryRecordStore::commit(const RemoteRecord& record) {
    ++tag_counter_;
    last_modified_at_ = record.modified_at;
    records_[record.record_id] = record;
}

Result<void, Error> MemoryRecordStore::check_zone() const {
    if (!zone_exists_) {
        return Result<void, Error>::err(Error{"Record zone does not exist", ErrorCode::ZoneNotFound});
    }
    return Result<void, Error>::ok();
}

Result<AccountStatus, Error> MemoryRecordStore::account_status() {
    std::lock_guard lock(mutex_);
    return Result<AccountStatus, Error>::ok(account_status_);
}

Result<std::vector<SaveOutcome>, Error> MemoryRecordStore::save_records(
    const std::vector<RecordSave>& batch, SavePolicy policy) {
    using R = Result<std::vector<SaveOutcome>, Error>;

    std::vector<SaveOutcome> outcomes;
    SaveHook hook;
    {
        std::lock_guard lock(mutex_);
        ++save_calls_;

        if (save_failures_left_ > 0 && save_failure_) {
            --save_failures_left_;
            return R::err(*save_failure_);
        }
        auto zone = check_zone();
        if (zone.is_err()) {
            return R::err(zone.unwrap_err());
        }

        outcomes.reserve(batch.size());
        for (const auto& save : batch) {
            const auto& id = save.record.record_id;

            auto injected = record_failures_.find(id);
            if (injected != record_failures_.end()) {
                outcomes.push_back(SaveOutcome{
                    .record_id = id,
                    .uuid = save.record.uuid,
                    .result = Result<RemoteRecord, Error>::err(injected->second)});
                record_failures_.erase(injected);
                continue;
            }

            std::optional<RemoteRecord> existing;
            if (auto it = records_.find(id); it != records_.end()) {
                existing = it->second;
            }

            auto saved = apply_save(existing, save, policy, candidate_tag(), candidate_modified_at());
            if (saved.is_ok()) {
                commit(saved.unwrap());
                ++saved_records_;
            }
            outcomes.push_back(SaveOutcome{.record_id = id, .uuid = save.record.uuid, .result = std::move(saved)});
        }
        hook = save_hook_;
    }

    if (hook) {
        hook(outcomes);
    }
    return R::ok(std::move(outcomes));
}

Result<QueryPage, Error> MemoryRecordStore::query_records(const RecordQuery& query) {
    using R = Result<QueryPage, Error>;

    std::lock_guard lock(mutex_);
    ++query_calls_;

    if (query_failures_left_ > 0 && query_failure_) {
        --query_failures_left_;
        return R::err(*query_failure_);
    }
    auto zone = check_zone();
    if (zone.is_err()) {
        return R::err(zone.unwrap_err());
    }
    if (expire_token_ && (query.cursor || query.modified_after.millis() > 0)) {
        expire_token_ = false;
        return R::err(Error{"Change token expired", ErrorCode::ChangeTokenExpired});
    }

    std::optional<std::pair<Timestamp, std::string>> position;
    if (query.cursor) {
        auto decoded = decode_cursor(*query.cursor);
        if (decoded.is_err()) {
            return R::err(decoded.unwrap_err());
        }
        position = std::move(decoded).unwrap();
    }

    std::vector<RemoteRecord> matching;
    for (const auto& [_, record] : records_) {
        if (record.modified_at <= query.modified_after) continue;
        if (!query.record_type.empty() && record.record_type != query.record_type) continue;
        if (position && !after_cursor(record, *position)) continue;
        matching.push_back(record);
    }
    std::sort(matching.begin(), matching.end(), [](const RemoteRecord& a, const RemoteRecord& b) {
        if (a.modified_at != b.modified_at) return a.modified_at < b.modified_at;
        return a.record_id < b.record_id;
    });

    QueryPage page;
    const auto limit = std::max<size_t>(query.limit, 1);
    if (matching.size() > limit) {
        matching.resize(limit);
        page.next_cursor = encode_cursor(matching.back());
    }
    page.records = std::move(matching);
    return R::ok(std::move(page));
}

Result<RemoteRecord, Error> MemoryRecordStore::fetch_record(const std::string& record_id) {
    using R = Result<RemoteRecord, Error>;

    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return R::err(zone.unwrap_err());
    }
    auto it = records_.find(record_id);
    if (it == records_.end()) {
        return R::err(Error{"No record " + record_id, ErrorCode::UnknownItem});
    }
    return R::ok(it->second);
}

Result<void, Error> MemoryRecordStore::delete_record(const std::string& record_id) {
    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return zone;
    }
    if (records_.erase(record_id) == 0) {
        return Result<void, Error>::err(Error{"No record " + record_id, ErrorCode::UnknownItem});
    }
    return Result<void, Error>::ok();
}

Result<SubscriptionHandle, Error> MemoryRecordStore::subscribe(const std::string& record_type,
                                                               Timestamp modified_after) {
    std::lock_guard lock(mutex_);
    auto handle = id_ + "-sub-" + std::to_string(++subscription_counter_);
    subscriptions_[handle] = RecordQuery{.modified_after = modified_after, .record_type = record_type};
    return Result<SubscriptionHandle, Error>::ok(std::move(handle));
}

Result<void, Error> MemoryRecordStore::unsubscribe(const SubscriptionHandle& handle) {
    std::lock_guard lock(mutex_);
    if (subscriptions_.erase(handle) == 0) {
        return Result<void, Error>::err(Error{"No subscription " + handle, ErrorCode::UnknownItem});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> MemoryRecordStore::create_zone() {
    std::lock_guard lock(mutex_);
    if (!zone_exists_) {
        qCInfo(tidesyncRemoteLog) << "Recreated record zone of" << id_.c_str();
    }
    zone_exists_ = true;
    return Result<void, Error>::ok();
}

void MemoryRecordStore::set_account_status(AccountStatus status) {
    std::lock_guard lock(mutex_);
    account_status_ = status;
}

void MemoryRecordStore::fail_next_saves(Error error, int count) {
    std::lock_guard lock(mutex_);
    save_failure_ = std::move(error);
    save_failures_left_ = count;
}

void MemoryRecordStore::fail_record_once(const std::string& record_id, Error error) {
    std::lock_guard lock(mutex_);
    record_failures_.insert_or_assign(record_id, std::move(error));
}

void MemoryRecordStore::fail_next_queries(Error error, int count) {
    std::lock_guard lock(mutex_);
    query_failure_ = std::move(error);
    query_failures_left_ = count;
}

void MemoryRecordStore::delete_zone() {
    std::lock_guard lock(mutex_);
    records_.clear();
    zone_exists_ = false;
}

void MemoryRecordStore::expire_change_token_once() {
    std::lock_guard lock(mutex_);
    expire_token_ = true;
}

void MemoryRecordStore::set_save_hook(SaveHook hook) {
    std::lock_guard lock(mutex_);
    save_hook_ = std::move(hook);
}

RemoteRecord MemoryRecordStore::put_record(RemoteRecord record) {
    std::lock_guard lock(mutex_);
    record.change_tag = candidate_tag();
    record.modified_at = candidate_modified_at();
    commit(record);
    return record;
}

std::optional<RemoteRecord> MemoryRecordStore::record(const std::string& record_id) const {
    std::lock_guard lock(mutex_);
    auto it = records_.find(record_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryRecordStore::record_count() const {
    std::lock_guard lock(mutex_);
    return records_.size();
}

int MemoryRecordStore::save_calls() const {
    std::lock_guard lock(mutex_);
    return save_calls_;
}

int MemoryRecordStore::saved_record_count() const {
    std::lock_guard lock(mutex_);
    return saved_records_;
}

int MemoryRecordStore::query_calls() const {
    std::lock_guard lock(mutex_);
    return query_calls_;
}

size_t MemoryRecordStore::subscription_count() const {
    std::lock_guard lock(mutex_);
    return subscriptions_.size();
}

} // namespace tidesync::remote
