#include "sqlite_job_store.hpp"

#include "json_text.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

double SqliteJobStore::wall_clock() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

SqliteJobStore::SqliteJobStore(Clock clock) : clock_(std::move(clock)) {}

SqliteJobStore::~SqliteJobStore() {
    close();
}

bool SqliteJobStore::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    if (path != ":memory:") {
        fs::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "jobs: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_busy_timeout(db_, 5000);

    if (!create_tables()) return false;

    return prepare("SELECT value FROM jobs WHERE key = ? AND expires_at > ?", &get_stmt_) &&
           prepare("INSERT INTO jobs (key, status, value, expires_at) VALUES (?, ?, ?, ?) "
                   "ON CONFLICT(key) DO UPDATE SET status = excluded.status, "
                   "value = excluded.value, expires_at = excluded.expires_at",
                   &upsert_stmt_) &&
           prepare("INSERT OR IGNORE INTO jobs (key, status, value, expires_at) "
                   "VALUES (?, ?, ?, ?)",
                   &insert_stmt_) &&
           prepare("DELETE FROM jobs WHERE key = ? AND status = ? AND expires_at > ?",
                   &remove_if_stmt_) &&
           prepare("DELETE FROM jobs WHERE key = ?", &remove_stmt_) &&
           prepare("DELETE FROM jobs WHERE expires_at <= ?", &purge_stmt_);
}

void SqliteJobStore::close() {
    for (auto** stmt : {&get_stmt_, &upsert_stmt_, &insert_stmt_, &remove_if_stmt_,
                        &remove_stmt_, &purge_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool SqliteJobStore::create_tables() {
    const char* sql =
        "CREATE TABLE IF NOT EXISTS jobs ("
        "  key TEXT PRIMARY KEY,"
        "  status TEXT NOT NULL,"
        "  value TEXT NOT NULL,"
        "  expires_at REAL NOT NULL"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_jobs_expires ON jobs(expires_at);";

    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "jobs: create tables failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool SqliteJobStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "jobs: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

Error SqliteJobStore::db_error(const char* what) const {
    return Error{ErrorCode::StoreFailed,
                 std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open")};
}

std::expected<std::string, Error> SqliteJobStore::serialize(const JobRecord& record) {
    try {
        return to_json_text(json(record));
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorCode::StoreFailed,
                                     "cannot encode job " + record.id + ": " + e.what()});
    }
}

std::expected<std::optional<JobRecord>, Error> SqliteJobStore::get(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (!get_stmt_) return std::unexpected(db_error("get"));

    auto key = key_for(id);
    sqlite3_reset(get_stmt_);
    sqlite3_bind_text(get_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(get_stmt_, 2, clock_());

    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_DONE) return std::optional<JobRecord>{};
    if (rc != SQLITE_ROW) return std::unexpected(db_error("get"));

    auto text = reinterpret_cast<const char*>(sqlite3_column_text(get_stmt_, 0));
    try {
        return std::optional<JobRecord>(json::parse(text ? text : "").get<JobRecord>());
    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorCode::StoreFailed,
                                     "corrupt record for " + key + ": " + e.what()});
    }
}

std::expected<void, Error> SqliteJobStore::put(const JobRecord& record,
                                               std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    if (!upsert_stmt_) return std::unexpected(db_error("put"));

    auto key = key_for(record.id);
    auto value = serialize(record);
    if (!value) return std::unexpected(value.error());
    auto status = std::string(job_status_name(record.status));

    double now = clock_();
    if (auto purged = purge_locked(now); !purged) return std::unexpected(purged.error());

    sqlite3_reset(upsert_stmt_);
    sqlite3_bind_text(upsert_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upsert_stmt_, 2, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(upsert_stmt_, 3, value->c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(upsert_stmt_, 4, now + static_cast<double>(ttl.count()));

    if (sqlite3_step(upsert_stmt_) != SQLITE_DONE) return std::unexpected(db_error("put"));
    return {};
}

std::expected<bool, Error> SqliteJobStore::insert_if_absent(const JobRecord& record,
                                                            std::chrono::seconds ttl) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return std::unexpected(db_error("insert"));

    auto key = key_for(record.id);
    auto value = serialize(record);
    if (!value) return std::unexpected(value.error());
    auto status = std::string(job_status_name(record.status));

    // Other processes may share the file, so purge and insert in one write transaction.
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
        return std::unexpected(db_error("begin"));
    }
    auto rollback = [this] { sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr); };

    double now = clock_();
    if (auto purged = purge_locked(now); !purged) {
        rollback();
        return std::unexpected(purged.error());
    }

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, status.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, value->c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 4, now + static_cast<double>(ttl.count()));

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        auto err = db_error("insert");
        rollback();
        return std::unexpected(err);
    }
    bool inserted = sqlite3_changes(db_) == 1;

    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
        auto err = db_error("commit");
        rollback();
        return std::unexpected(err);
    }
    return inserted;
}

std::expected<bool, Error> SqliteJobStore::remove_if_status(const std::string& id,
                                                            JobStatus status) {
    std::lock_guard lock(mutex_);
    if (!remove_if_stmt_) return std::unexpected(db_error("remove"));

    auto key = key_for(id);
    auto name = std::string(job_status_name(status));

    sqlite3_reset(remove_if_stmt_);
    sqlite3_bind_text(remove_if_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(remove_if_stmt_, 2, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(remove_if_stmt_, 3, clock_());

    if (sqlite3_step(remove_if_stmt_) != SQLITE_DONE) return std::unexpected(db_error("remove"));
    return sqlite3_changes(db_) == 1;
}

std::expected<void, Error> SqliteJobStore::remove(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (!remove_stmt_) return std::unexpected(db_error("remove"));

    auto key = key_for(id);
    sqlite3_reset(remove_stmt_);
    sqlite3_bind_text(remove_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(remove_stmt_) != SQLITE_DONE) return std::unexpected(db_error("remove"));
    return {};
}

std::expected<int, Error> SqliteJobStore::purge_expired() {
    std::lock_guard lock(mutex_);
    return purge_locked(clock_());
}

std::expected<int, Error> SqliteJobStore::purge_locked(double now) {
    if (!purge_stmt_) return std::unexpected(db_error("purge"));

    sqlite3_reset(purge_stmt_);
    sqlite3_bind_double(purge_stmt_, 1, now);
    if (sqlite3_step(purge_stmt_) != SQLITE_DONE) return std::unexpected(db_error("purge"));
    return sqlite3_changes(db_);
}
