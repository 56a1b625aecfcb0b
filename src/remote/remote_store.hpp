#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tidesync::remote {

enum class AccountStatus {
    Available,
    NoAccount,
    Restricted,
    Unknown
};

[[nodiscard]] std::string_view to_string(AccountStatus status);

/**
 * RemoteRecord - an entity as the remote store holds it.
 *
 * `change_tag` is assigned by the store on every successful save;
 * `modified_at` is the server modification time the download watermark is
 * compared against. Both are ignored on the way in.
 */
struct RemoteRecord {
    std::string record_id;
    Uuid uuid;
    std::string record_type;
    std::optional<std::string> change_tag;
    FieldMap fields;
    FieldStamps field_stamps;
    Timestamp last_modified;
    Timestamp modified_at;
};

enum class SavePolicy {
    IfServerRecordUnchanged,  // change tag must match; all keys written
    ChangedKeysOnly,          // change tag must match; only changed_keys written
    AllKeys                   // no check; all keys written
};

struct RecordSave {
    RemoteRecord record;
    std::vector<std::string> changed_keys;
};

/**
 * Per-record outcome of a batch save.
 */
struct SaveOutcome {
    std::string record_id;
    Uuid uuid;
    Result<RemoteRecord, Error> result;
};

struct RecordQuery {
    Timestamp modified_after;
    std::string record_type;
    size_t limit{100};
    std::optional<std::string> cursor;
};

struct QueryPage {
    std::vector<RemoteRecord> records;  // modified_at ascending, then record_id
    std::optional<std::string> next_cursor;
};

using SubscriptionHandle = std::string;

/**
 * RemoteRecordStore - the remote side of the sync engine.
 *
 * Batch-level failures (network, account, zone) come back as the outer
 * error; record-level failures as the SaveOutcome of that record. Every
 * implementation must be safe to call from the orchestrator's thread
 * while tests or tools mutate it from another.
 */
class RemoteRecordStore {
public:
    virtual ~RemoteRecordStore() = default;

    // Stable identity, used to key the download watermark.
    [[nodiscard]] virtual std::string store_id() const = 0;

    [[nodiscard]] virtual Result<AccountStatus, Error> account_status() = 0;

    [[nodiscard]] virtual Result<std::vector<SaveOutcome>, Error> save_records(
        const std::vector<RecordSave>& batch, SavePolicy policy) = 0;

    [[nodiscard]] virtual Result<QueryPage, Error> query_records(const RecordQuery& query) = 0;

    // UnknownItem when the record does not exist.
    [[nodiscard]] virtual Result<RemoteRecord, Error> fetch_record(const std::string& record_id) = 0;

    [[nodiscard]] virtual Result<void, Error> delete_record(const std::string& record_id) = 0;

    // Registration only; nothing is ever delivered.
    [[nodiscard]] virtual Result<SubscriptionHandle, Error> subscribe(const std::string& record_type,
                                                                      Timestamp modified_after) = 0;
    [[nodiscard]] virtual Result<void, Error> unsubscribe(const SubscriptionHandle& handle) = 0;

    // Recreate the record zone after ZoneNotFound. Existing records are gone.
    [[nodiscard]] virtual Result<void, Error> create_zone() = 0;
};

/**
 * Save rule shared by the store implementations.
 *
 * Creates the record when `existing` is empty. Otherwise checks the change
 * tag (unless AllKeys) and fails with ServerRecordChanged when it is stale
 * or missing. On success the returned record carries `new_tag` and
 * `modified_at`.
 */
[[nodiscard]] Result<RemoteRecord, Error> apply_save(const std::optional<RemoteRecord>& existing,
                                                     const RecordSave& save,
                                                     SavePolicy policy,
                                                     std::string new_tag,
                                                     Timestamp modified_at);

/**
 * Query cursors are "<modified_at ms>:<record_id>" of the last record
 * returned. They are opaque to callers.
 */
[[nodiscard]] std::string encode_cursor(const RemoteRecord& last);
[[nodiscard]] Result<std::pair<Timestamp, std::string>, Error> decode_cursor(std::string_view cursor);

// True if `record` sorts after the cursor position.
[[nodiscard]] bool after_cursor(const RemoteRecord& record, const std::pair<Timestamp, std::string>& position);

} // namespace tidesync::remote
