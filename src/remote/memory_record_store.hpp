#pragma once

#include "remote/remote_store.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tidesync::remote {

/**
 * MemoryRecordStore - in-process remote store with fault injection.
 *
 * Backs the tests and the cycle-check tool. Several local stores may sync
 * through one instance to simulate devices sharing an account.
 */
class MemoryRecordStore : public RemoteRecordStore {
public:
    using Clock = std::function<Timestamp()>;
    // Called after each applied batch, outside the store lock.
    using SaveHook = std::function<void(const std::vector<SaveOutcome>&)>;

    explicit MemoryRecordStore(std::string id = "memory", Clock clock = &Timestamp::now);

    [[nodiscard]] std::string store_id() const override { return id_; }
    [[nodiscard]] Result<AccountStatus, Error> account_status() override;
    [[nodiscard]] Result<std::vector<SaveOutcome>, Error> save_records(
        const std::vector<RecordSave>& batch, SavePolicy policy) override;
    [[nodiscard]] Result<QueryPage, Error> query_records(const RecordQuery& query) override;
    [[nodiscard]] Result<RemoteRecord, Error> fetch_record(const std::string& record_id) override;
    [[nodiscard]] Result<void, Error> delete_record(const std::string& record_id) override;
    [[nodiscard]] Result<SubscriptionHandle, Error> subscribe(const std::string& record_type,
                                                              Timestamp modified_after) override;
    [[nodiscard]] Result<void, Error> unsubscribe(const SubscriptionHandle& handle) override;
    [[nodiscard]] Result<void, Error> create_zone() override;

    // Fault injection

    void set_account_status(AccountStatus status);
    // The next `count` save_records calls fail as a whole with `error`.
    void fail_next_saves(Error error, int count = 1);
    // The next save of `record_id` fails with `error`; the rest of its batch commits.
    void fail_record_once(const std::string& record_id, Error error);
    void fail_next_queries(Error error, int count = 1);
    // Drops every record; calls fail with ZoneNotFound until create_zone().
    void delete_zone();
    // The next query that resumes from a watermark or cursor fails with ChangeTokenExpired.
    void expire_change_token_once();
    void set_save_hook(SaveHook hook);

    // Another device writing directly: assigns a fresh tag and modification time.
    RemoteRecord put_record(RemoteRecord record);

    [[nodiscard]] std::optional<RemoteRecord> record(const std::string& record_id) const;
    [[nodiscard]] size_t record_count() const;
    [[nodiscard]] int save_calls() const;
    [[nodiscard]] int saved_record_count() const;
    [[nodiscard]] int query_calls() const;
    [[nodiscard]] size_t subscription_count() const;

private:
    [[nodiscard]] std::string candidate_tag() const;
    [[nodiscard]] Timestamp candidate_modified_at() const;
    void commit(const RemoteRecord& record);
    [[nodiscard]] Result<void, Error> check_zone() const;

    const std::string id_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::map<std::string, RemoteRecord> records_;
    std::map<SubscriptionHandle, RecordQuery> subscriptions_;
    AccountStatus account_status_{AccountStatus::Available};
    bool zone_exists_{true};
    int64_t tag_counter_{0};
    int64_t subscription_counter_{0};
    Timestamp last_modified_at_;

    std::optional<Error> save_failure_;
    int save_failures_left_{0};
    std::map<std::string, Error> record_failures_;
    std::optional<Error> query_failure_;
    int query_failures_left_{0};
    bool expire_token_{false};
    SaveHook save_hook_;

    int save_calls_{0};
    int saved_records_{0};
    int query_calls_{0};
};

} // namespace tidesync::remote
