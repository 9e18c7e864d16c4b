#pragma once

#include "errors.hpp"
#include "job_record.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "storage/job_store.hpp"
#include "worker_pool.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <string>

struct SubmitResult {
    JobRecord record;
    bool accepted = false; // true only when a new background task was launched
};

// Asynchronous, idempotent job front end. State lives only in the JobStore;
// background tasks report back solely by writing their final record.
class JobOrchestrator {
public:
    using LoadedCallback = std::function<void(double)>;
    using Runner = std::function<std::expected<TranscriptionResult, Error>(
        const std::string& audio_ref, const std::string& language,
        const LoadedCallback& on_loaded)>;
    using Clock = std::function<double()>;

    static constexpr size_t kMaxIdLength = 256;

    JobOrchestrator(JobStore& store, WorkerPool& pool, Runner runner,
                    std::chrono::seconds ttl, double timeout_base_seconds,
                    bool verbose = false, Clock clock = {});

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    std::expected<SubmitResult, Error> submit(const std::string& id, const std::string& audio_ref,
                                              const std::string& language);

    // NotFound when the record never existed or has expired.
    std::expected<JobRecord, Error> get_status(const std::string& id);

    // Processing for longer than the adaptive timeout allows. Monitoring only.
    bool is_overdue(const JobRecord& record) const;

private:
    void run_job(JobRecord record);
    void log(const std::string& msg);

    JobStore& store_;
    WorkerPool& pool_;
    Runner runner_;
    std::chrono::seconds ttl_;
    double timeout_base_;
    bool verbose_;
    Clock clock_;
};
