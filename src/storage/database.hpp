#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace tidesync::storage {

/**
 * Statement - one prepared SQLite statement, finalized on destruction.
 *
 * Parameters are positional and 1-based. Column getters are 0-based and
 * only meaningful after step() returned a row.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}

    Result<void> bind_text(int index, std::string_view text);
    Result<void> bind_int(int index, int value);
    Result<void> bind_int64(int index, int64_t value);
    Result<void> bind_double(int index, double value);
    Result<void> bind_null(int index);

    // Binds args to ?1..?N; the first failure wins.
    template<typename... Args>
    [[nodiscard]] Result<void> bind_all(const Args&... args) {
        int index = 1;
        Result<void> outcome = Result<void>::ok();
        auto next = [&](const auto& arg) {
            if (outcome.is_ok()) outcome = bind_value(index, arg);
            ++index;
        };
        (next(args), ...);
        return outcome;
    }

    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // true while rows remain.
    Result<bool> step();

    // For statements that return no rows (INSERT, UPDATE, DELETE).
    template<typename... Args>
    [[nodiscard]] Result<void> run(const Args&... args) {
        return bind_all(args...).and_then([this]() -> Result<void> {
            auto stepped = step();
            if (stepped.is_err()) return Result<void>::err(stepped.unwrap_err());
            return Result<void>::ok();
        });
    }

private:
    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };

    Result<void> bind_value(int index, std::string_view text) { return bind_text(index, text); }
    Result<void> bind_value(int index, const std::string& text) { return bind_text(index, text); }
    Result<void> bind_value(int index, const char* text) { return bind_text(index, text); }
    Result<void> bind_value(int index, int value) { return bind_int(index, value); }
    Result<void> bind_value(int index, int64_t value) { return bind_int64(index, value); }
    Result<void> bind_value(int index, double value) { return bind_double(index, value); }
    Result<void> bind_value(int index, std::nullopt_t) { return bind_null(index); }

    template<typename T>
    Result<void> bind_value(int index, const std::optional<T>& value) {
        return value ? bind_value(index, *value) : bind_null(index);
    }

    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;
};

/**
 * Database - an owned SQLite connection.
 *
 * Connections are opened with foreign keys on, WAL journaling and a busy
 * timeout so a second process on the same file waits instead of failing.
 * A connection belongs to the thread that drives the sync cycle; nothing
 * here locks.
 */
class Database {
public:
    Database() = default;

    [[nodiscard]] static Result<Database> open(const std::string& path);
    [[nodiscard]] static Result<Database> open_memory();

    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    // Runs one or more statements that return no rows.
    [[nodiscard]] Result<void> execute(const std::string& sql);

    // Binds args, then hands every row to on_row.
    template<typename F, typename... Args>
    [[nodiscard]] Result<void> query(const std::string& sql, F&& on_row, const Args&... args) {
        auto prepared = prepare(sql);
        if (prepared.is_err()) return Result<void>::err(prepared.unwrap_err());
        auto stmt = std::move(prepared).unwrap();
        if (auto bound = stmt.bind_all(args...); bound.is_err()) return bound;

        for (;;) {
            auto row = stmt.step();
            if (row.is_err()) return Result<void>::err(row.unwrap_err());
            if (!row.unwrap()) return Result<void>::ok();
            on_row(stmt);
        }
    }

    /**
     * Runs body inside BEGIN/COMMIT. An error from body, or a failed
     * COMMIT, rolls everything back and is returned unchanged.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& body) -> std::invoke_result_t<F&> {
        using Outcome = std::invoke_result_t<F&>;

        if (auto begun = execute("BEGIN;"); begun.is_err()) {
            return Outcome::err(begun.unwrap_err());
        }
        auto outcome = body();
        if (outcome.is_err()) {
            abandon_transaction();
            return outcome;
        }
        if (auto committed = execute("COMMIT;"); committed.is_err()) {
            abandon_transaction();
            return Outcome::err(committed.unwrap_err());
        }
        return outcome;
    }

    [[nodiscard]] int64_t last_insert_rowid() const;

    // Rows touched by the most recent INSERT, UPDATE or DELETE.
    [[nodiscard]] int changes() const;

private:
    struct Closer {
        void operator()(sqlite3* db) const { sqlite3_close(db); }
    };

    explicit Database(sqlite3* db) : db_(db) {}

    void abandon_transaction();

    std::unique_ptr<sqlite3, Closer> db_;
};

} // namespace tidesync::storage
