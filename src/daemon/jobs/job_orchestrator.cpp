#include "job_orchestrator.hpp"

#include "pipeline/timeout.hpp"

#include <exception>
#include <format>
#include <print>

namespace {

double wall_clock() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(now).count();
}

} // namespace

JobOrchestrator::JobOrchestrator(JobStore& store, WorkerPool& pool, Runner runner,
                                 std::chrono::seconds ttl, double timeout_base_seconds,
                                 bool verbose, Clock clock)
    : store_(store), pool_(pool), runner_(std::move(runner)), ttl_(ttl),
      timeout_base_(timeout_base_seconds), verbose_(verbose),
      clock_(clock ? std::move(clock) : Clock(wall_clock)) {}

std::expected<SubmitResult, Error>
JobOrchestrator::submit(const std::string& id, const std::string& audio_ref,
                        const std::string& language) {
    if (id.empty() || id.size() > kMaxIdLength) {
        return std::unexpected(Error{ErrorCode::InvalidRequest,
            std::format("job id must be 1-{} characters", kMaxIdLength)});
    }
    if (audio_ref.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidRequest, "audio reference is required"});
    }

    auto existing = store_.get(id);
    if (!existing) return std::unexpected(existing.error());

    if (*existing) {
        const auto& rec = **existing;
        if (rec.status != JobStatus::Failed) {
            log(std::format("job {}: already {}, not resubmitting", id, job_status_name(rec.status)));
            return SubmitResult{rec, false};
        }
        // Conditional delete so a concurrent resubmission that already
        // replaced the failed record is left alone.
        auto removed = store_.remove_if_status(id, JobStatus::Failed);
        if (!removed) return std::unexpected(removed.error());
        if (*removed) log(std::format("job {}: previous attempt failed, retrying", id));
    }

    JobRecord rec;
    rec.id = id;
    rec.status = JobStatus::Processing;
    rec.audio = audio_ref;
    rec.language = language;
    rec.created_at = clock_();

    auto inserted = store_.insert_if_absent(rec, ttl_);
    if (!inserted) return std::unexpected(inserted.error());

    if (!*inserted) {
        // Lost the race to another submission of the same id.
        auto current = store_.get(id);
        if (!current) return std::unexpected(current.error());
        if (*current) return SubmitResult{**current, false};
        return std::unexpected(Error{ErrorCode::StoreFailed,
                                     "job " + id + " vanished during submission"});
    }

    if (!pool_.submit([this, rec] { run_job(rec); })) {
        rec.status = JobStatus::Failed;
        rec.error = "service is shutting down";
        rec.error_code = std::string(error_code_name(ErrorCode::InferenceFailed));
        rec.finished_at = clock_();
        if (auto put = store_.put(rec, ttl_); !put) {
            std::println(stderr, "jobs: failed to record rejected job {}: {}", id,
                         put.error().message);
        }
        return std::unexpected(Error{ErrorCode::InferenceFailed, *rec.error});
    }

    log(std::format("job {}: accepted", id));
    return SubmitResult{rec, true};
}

std::expected<JobRecord, Error> JobOrchestrator::get_status(const std::string& id) {
    auto rec = store_.get(id);
    if (!rec) return std::unexpected(rec.error());
    if (!*rec) return std::unexpected(Error{ErrorCode::NotFound, "job not found: " + id});

    if (is_overdue(**rec)) {
        std::println(stderr, "jobs: job {} has been processing for {:.0f}s, past its {:.0f}s budget",
                     id, clock_() - (*rec)->created_at,
                     calculate_timeout(timeout_base_, (*rec)->duration.value_or(0.0)));
    }
    return **rec;
}

bool JobOrchestrator::is_overdue(const JobRecord& record) const {
    if (record.status != JobStatus::Processing) return false;
    double elapsed = clock_() - record.created_at;
    return elapsed > calculate_timeout(timeout_base_, record.duration.value_or(0.0));
}

void JobOrchestrator::run_job(JobRecord record) {
    log(std::format("job {}: started", record.id));

    auto on_loaded = [this, &record](double duration) {
        record.duration = duration;
        if (auto put = store_.put(record, ttl_); !put) {
            std::println(stderr, "jobs: failed to update job {}: {}", record.id,
                         put.error().message);
        }
    };

    std::expected<TranscriptionResult, Error> result;
    try {
        result = runner_(record.audio, record.language, on_loaded);
    } catch (const std::exception& e) {
        // The record must still leave PROCESSING or the id stays blocked until its TTL.
        result = std::unexpected(Error{ErrorCode::InferenceFailed,
                                       std::string("transcription aborted: ") + e.what()});
    }

    record.finished_at = clock_();
    if (result) {
        record.status = JobStatus::Completed;
        record.transcription = result->text;
        record.duration = result->duration;
        record.confidence = result->confidence;
        record.processing_time = result->processing_time;
        log(std::format("job {}: completed, {} chars in {:.1f}s", record.id,
                        result->text.size(), result->processing_time));
    } else {
        record.status = JobStatus::Failed;
        record.error = result.error().message;
        record.error_code = std::string(error_code_name(result.error().code));
        std::println(stderr, "jobs: job {} failed: {}", record.id, result.error().message);
    }

    auto put = store_.put(record, ttl_);
    if (!put && record.status == JobStatus::Completed) {
        std::println(stderr, "jobs: failed to store result of job {}: {}", record.id,
                     put.error().message);
        // Fall back to a small FAILED record so the id can be resubmitted.
        JobRecord failed;
        failed.id = record.id;
        failed.status = JobStatus::Failed;
        failed.audio = record.audio;
        failed.language = record.language;
        failed.created_at = record.created_at;
        failed.duration = record.duration;
        failed.finished_at = record.finished_at;
        failed.error = "could not store the transcription: " + put.error().message;
        failed.error_code = std::string(error_code_name(put.error().code));
        put = store_.put(failed, ttl_);
    }
    if (!put) {
        std::println(stderr, "jobs: failed to store result of job {}: {}", record.id,
                     put.error().message);
    }
}

void JobOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperd] {}", msg);
    }
}
