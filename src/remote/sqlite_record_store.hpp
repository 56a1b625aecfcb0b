#pragma once

#include "remote/remote_store.hpp"
#include "storage/database.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace tidesync::remote {

/**
 * SqliteRecordStore - remote store emulation in its own SQLite file.
 *
 * Lets several local databases sync through one file from the command
 * line. The account is always available; the zone can be deleted and
 * recreated like a real one.
 */
class SqliteRecordStore : public RemoteRecordStore {
public:
    using Clock = std::function<Timestamp()>;

    /**
     * Open (creating and migrating if needed) the emulation database.
     * ":memory:" gives a private in-memory store.
     */
    [[nodiscard]] static Result<std::unique_ptr<SqliteRecordStore>, Error> open(
        const std::string& path, Clock clock = &Timestamp::now);

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

    // Drops every record and marks the zone missing.
    [[nodiscard]] Result<void, Error> delete_zone();

private:
    SqliteRecordStore(storage::Database db, std::string id, Clock clock)
        : db_(std::move(db)), id_(std::move(id)), clock_(std::move(clock)) {}

    [[nodiscard]] Result<void, Error> check_zone();
    [[nodiscard]] Result<std::optional<RemoteRecord>, Error> load(const std::string& record_id);
    [[nodiscard]] Result<RemoteRecord, Error> save_one(const RecordSave& save, SavePolicy policy);
    [[nodiscard]] Result<RemoteRecord, Error> row_to_record(storage::Statement& stmt);

    std::mutex mutex_;
    storage::Database db_;
    const std::string id_;
    Clock clock_;
};

} // namespace tidesync::remote
