#pragma once

#include "audio/audio_loader.hpp"
#include "config.hpp"
#include "jobs/job_orchestrator.hpp"
#include "jobs/worker_pool.hpp"
#include "pipeline/transcription_pipeline.hpp"
#include "pipeline/transcription_service.hpp"
#include "platform/ipc_server.hpp"
#include "storage/sqlite_job_store.hpp"
#include "whisper/backend.hpp"
#include "whisper/transcription_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

class DaemonCore {
public:
    using BackendFactory = std::function<std::unique_ptr<WhisperBackend>(const Config::Backend&)>;
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose, IpcServer& ipc,
               BackendFactory backend_factory, NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // A response with status "transcribing" is deferred; the reply is sent
    // later from on_transcription_complete() or check_timeouts().
    nlohmann::json handle_command(int client_fd, const std::string& cmd_str,
                                  const nlohmann::json& cmd);

    // Event-loop side of worker completion notifications.
    void on_transcription_complete();

    // Replies with a timeout error to every synchronous request past its deadline.
    void check_timeouts();

    // Milliseconds until the nearest synchronous deadline, -1 if none pending.
    int next_timeout_ms() const;

    void remove_waiting_client(int fd);

    size_t pending_requests() const { return pending_.size(); }

    void shutdown();

    static std::unique_ptr<WhisperBackend> make_backend(const Config::Backend& cfg, bool verbose);

private:
    nlohmann::json handle_transcribe(int client_fd, const nlohmann::json& cmd);
    nlohmann::json handle_submit(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_health(const nlohmann::json& cmd);

    std::string job_db_path() const;
    void log(const std::string& msg);

    using SteadyClock = std::chrono::steady_clock;

    struct PendingRequest {
        uint64_t id;
        int client_fd;
        SteadyClock::time_point started;
        // Written by the worker once the audio is decoded; 0 until then.
        std::shared_ptr<std::atomic<double>> audio_duration;

        SteadyClock::time_point deadline(double base_seconds) const;
    };

    struct CompletedRequest {
        uint64_t id;
        std::expected<TranscriptionResult, Error> result;
    };

    Config config_;
    bool verbose_;
    IpcServer& ipc_;
    BackendFactory backend_factory_;
    NotifyCallback notify_;

    std::unique_ptr<TranscriptionEngine> engine_;
    std::unique_ptr<AudioLoader> loader_;
    std::unique_ptr<TranscriptionPipeline> pipeline_;
    std::unique_ptr<TranscriptionService> service_;
    SqliteJobStore store_;
    std::unique_ptr<JobOrchestrator> orchestrator_;
    // Declared last so workers are joined before anything they use is destroyed.
    std::unique_ptr<WorkerPool> pool_;

    // Event-loop thread only.
    std::vector<PendingRequest> pending_;
    uint64_t next_request_id_ = 1;

    std::mutex completed_mutex_;
    std::vector<CompletedRequest> completed_;
};
