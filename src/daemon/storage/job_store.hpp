#pragma once

#include "errors.hpp"
#include "jobs/job_record.hpp"

#include <chrono>
#include <expected>
#include <optional>
#include <string>

// Key/value store for job records with a per-record time-to-live.
// Expired records are indistinguishable from absent ones.
class JobStore {
public:
    virtual ~JobStore() = default;

    virtual std::expected<std::optional<JobRecord>, Error> get(const std::string& id) = 0;

    // Unconditional write. Every write refreshes the TTL.
    virtual std::expected<void, Error> put(const JobRecord& record,
                                           std::chrono::seconds ttl) = 0;

    // Atomic create. Returns false if a live record already exists for the id.
    virtual std::expected<bool, Error> insert_if_absent(const JobRecord& record,
                                                        std::chrono::seconds ttl) = 0;

    // Atomic delete that only succeeds while the live record has the given status.
    virtual std::expected<bool, Error> remove_if_status(const std::string& id,
                                                        JobStatus status) = 0;

    virtual std::expected<void, Error> remove(const std::string& id) = 0;
};
