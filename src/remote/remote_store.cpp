#include "remote/remote_store.hpp"

#include <charconv>

namespace tidesync::remote {

std::string_view to_string(AccountStatus status) {
    switch (status) {
        case AccountStatus::Available: return "available";
        case AccountStatus::NoAccount: return "no_account";
        case AccountStatus::Restricted: return "restricted";
        case AccountStatus::Unknown: return "unknown";
    }
    return "unknown";
}

Result<RemoteRecord, Error> apply_save(const std::optional<RemoteRecord>& existing,
                                       const RecordSave& save,
                                       SavePolicy policy,
                                       std::string new_tag,
                                       Timestamp modified_at) {
    using R = Result<RemoteRecord, Error>;

    if (save.record.record_id.empty()) {
        return R::err(Error{"Record without a record id", ErrorCode::InvalidArguments});
    }

    RemoteRecord stored;
    if (!existing) {
        stored = save.record;
    } else {
        if (policy != SavePolicy::AllKeys && save.record.change_tag != existing->change_tag) {
            return R::err(Error{"Record " + save.record.record_id + " changed on the server",
                                ErrorCode::ServerRecordChanged});
        }
        if (existing->record_type != save.record.record_type) {
            return R::err(Error{"Record " + save.record.record_id + " is a '" + existing->record_type +
                                    "', not a '" + save.record.record_type + "'",
                                ErrorCode::InvalidEntityType});
        }

        if (policy == SavePolicy::ChangedKeysOnly) {
            stored = *existing;
            for (const auto& key : save.changed_keys) {
                auto field = save.record.fields.find(key);
                if (field != save.record.fields.end()) {
                    stored.fields[key] = field->second;
                } else {
                    stored.fields.erase(key);
                }
                auto stamp = save.record.field_stamps.find(key);
                if (stamp != save.record.field_stamps.end()) {
                    stored.field_stamps[key] = stamp->second;
                }
            }
            stored.last_modified = save.record.last_modified;
        } else {
            stored = save.record;
        }
    }

    stored.change_tag = std::move(new_tag);
    stored.modified_at = modified_at;
    return R::ok(std::move(stored));
}

std::string encode_cursor(const RemoteRecord& last) {
    return std::to_string(last.modified_at.millis()) + ":" + last.record_id;
}

Result<std::pair<Timestamp, std::string>, Error> decode_cursor(std::string_view cursor) {
    using R = Result<std::pair<Timestamp, std::string>, Error>;

    const auto colon = cursor.find(':');
    if (colon == std::string_view::npos) {
        return R::err(Error{"Malformed query cursor", ErrorCode::InvalidArguments});
    }
    int64_t millis = 0;
    const auto* first = cursor.data();
    const auto* last = cursor.data() + colon;
    auto [ptr, ec] = std::from_chars(first, last, millis);
    if (ec != std::errc{} || ptr != last) {
        return R::err(Error{"Malformed query cursor", ErrorCode::InvalidArguments});
    }
    return R::ok({Timestamp(millis), std::string(cursor.substr(colon + 1))});
}

bool after_cursor(const RemoteRecord& record, const std::pair<Timestamp, std::string>& position) {
    if (record.modified_at != position.first) return record.modified_at > position.first;
    return record.record_id > position.second;
}

} // namespace tidesync::remote
