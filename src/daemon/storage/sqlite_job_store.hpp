#pragma once

#include "job_store.hpp"

#include <functional>
#include <mutex>
#include <sqlite3.h>
#include <string>

class SqliteJobStore : public JobStore {
public:
    // Seconds since the unix epoch.
    using Clock = std::function<double()>;

    static double wall_clock();

    explicit SqliteJobStore(Clock clock = wall_clock);
    ~SqliteJobStore() override;

    SqliteJobStore(const SqliteJobStore&) = delete;
    SqliteJobStore& operator=(const SqliteJobStore&) = delete;

    // Pass ":memory:" for a private in-memory database.
    bool open(const std::string& path);
    void close();

    std::expected<std::optional<JobRecord>, Error> get(const std::string& id) override;
    std::expected<void, Error> put(const JobRecord& record, std::chrono::seconds ttl) override;
    std::expected<bool, Error> insert_if_absent(const JobRecord& record,
                                                std::chrono::seconds ttl) override;
    std::expected<bool, Error> remove_if_status(const std::string& id,
                                                JobStatus status) override;
    std::expected<void, Error> remove(const std::string& id) override;

    // Deletes expired rows, returns how many were removed.
    std::expected<int, Error> purge_expired();

    static std::string key_for(const std::string& id) { return "job:" + id; }

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    Error db_error(const char* what) const;
    static std::expected<std::string, Error> serialize(const JobRecord& record);
    std::expected<int, Error> purge_locked(double now);

    Clock clock_;
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* upsert_stmt_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* remove_if_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
    sqlite3_stmt* purge_stmt_ = nullptr;
};
