#include "daemon_core.hpp"

#include "pipeline/timeout.hpp"
#include "platform/platform_paths.hpp"
#include "whisper/lan_backend.hpp"
#include "whisper/whisper_cpp_backend.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

nlohmann::json error_response(const Error& err) {
    return {
        {"status", "error"},
        {"code", error_code_name(err.code)},
        {"transient", is_transient(err.code)},
        {"message", err.message},
    };
}

nlohmann::json result_response(const TranscriptionResult& r) {
    return {
        {"status", "ok"},
        {"text", r.text},
        {"duration", r.duration},
        {"confidence", r.confidence},
        {"processing_time", r.processing_time},
        {"real_time_factor", r.real_time_factor()},
        {"chunks", {
            {"total", r.chunks.total},
            {"transcribed", r.chunks.transcribed},
            {"skipped", r.chunks.skipped},
            {"failed", r.chunks.failed},
            {"duplicates_removed", r.chunks.duplicates_removed},
        }},
    };
}

} // namespace

DaemonCore::SteadyClock::time_point DaemonCore::PendingRequest::deadline(double base_seconds) const {
    double budget = calculate_timeout(base_seconds, audio_duration->load(std::memory_order_acquire));
    return started + std::chrono::duration_cast<SteadyClock::duration>(
                         std::chrono::duration<double>(budget));
}

DaemonCore::DaemonCore(Config config, bool verbose, IpcServer& ipc,
                       BackendFactory backend_factory, NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose), ipc_(ipc),
      backend_factory_(std::move(backend_factory)), notify_(std::move(notify)) {}

DaemonCore::~DaemonCore() {
    if (pool_) pool_->shutdown();
}

std::unique_ptr<WhisperBackend> DaemonCore::make_backend(const Config::Backend& cfg, bool verbose) {
    if (cfg.type == "whisper") {
        return std::make_unique<WhisperCppBackend>(
            cfg.model_path, static_cast<int>(cfg.resolved_threads()), cfg.use_gpu, verbose);
    }
    if (cfg.type == "lan") {
        return std::make_unique<LanBackend>(cfg.url, cfg.api_format);
    }
    return nullptr;
}

bool DaemonCore::init() {
    if (auto valid = config_.validate(); !valid) {
        std::println(stderr, "config: {}", valid.error().message);
        return false;
    }

    auto backend = backend_factory_(config_.backend);
    if (!backend) {
        std::println(stderr, "Unknown backend type: {}", config_.backend.type);
        return false;
    }

    engine_ = std::make_unique<TranscriptionEngine>(
        std::move(backend), std::chrono::seconds(config_.backend.call_timeout_seconds), verbose_);
    if (auto res = engine_->init(); !res) {
        std::println(stderr, "engine: failed to initialize {} backend: {}",
                     engine_->backend_name(), res.error().message);
        return false;
    }

    loader_ = std::make_unique<AudioLoader>(config_.audio.sample_rate,
                                            config_.audio.max_upload_bytes());

    PipelineOptions opts;
    opts.chunking_enabled = config_.chunking.enabled;
    opts.segments.chunk_seconds = config_.chunking.duration_seconds;
    opts.segments.overlap_seconds = config_.chunking.overlap_seconds;
    opts.segments.min_final_seconds = config_.chunking.min_final_seconds;
    pipeline_ = std::make_unique<TranscriptionPipeline>(*engine_, opts, verbose_);

    service_ = std::make_unique<TranscriptionService>(*loader_, *pipeline_,
                                                      config_.backend.language);

    auto db_path = job_db_path();
    if (!store_.open(db_path)) {
        std::println(stderr, "jobs: store failed to open at {}", db_path);
        return false;
    }
    log("Job store at " + db_path);

    pool_ = std::make_unique<WorkerPool>(config_.jobs.workers);

    orchestrator_ = std::make_unique<JobOrchestrator>(
        store_, *pool_,
        [this](const std::string& audio, const std::string& language,
               const JobOrchestrator::LoadedCallback& on_loaded) {
            return service_->transcribe(audio, language, on_loaded);
        },
        std::chrono::seconds(config_.jobs.ttl_seconds), config_.timeout.base_seconds, verbose_);

    return true;
}

std::string DaemonCore::job_db_path() const {
    if (!config_.jobs.db_path.empty()) return config_.jobs.db_path;
    auto data = platform::data_dir();
    if (!data.empty()) return data + "/jobs.db";
    return "/tmp/whisperd/jobs.db";
}

nlohmann::json DaemonCore::handle_command(int client_fd, const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    try {
        if (cmd_str == "transcribe") return handle_transcribe(client_fd, cmd);
        if (cmd_str == "submit") return handle_submit(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "health") return handle_health(cmd);
    } catch (const nlohmann::json::exception& e) {
        return error_response({ErrorCode::InvalidRequest, std::string("malformed request: ") + e.what()});
    }
    return error_response({ErrorCode::InvalidRequest, "unknown command"});
}

nlohmann::json DaemonCore::handle_transcribe(int client_fd, const nlohmann::json& cmd) {
    auto audio = cmd.value("audio", std::string{});
    if (audio.empty()) {
        return error_response({ErrorCode::InvalidRequest, "audio reference is required"});
    }
    auto language = cmd.value("language", std::string{});

    PendingRequest req{
        .id = next_request_id_++,
        .client_fd = client_fd,
        .started = SteadyClock::now(),
        .audio_duration = std::make_shared<std::atomic<double>>(0.0),
    };

    bool queued = pool_->submit([this, id = req.id, duration = req.audio_duration,
                                 audio, language] {
        auto result = service_->transcribe(audio, language, [&duration](double d) {
            duration->store(d, std::memory_order_release);
        });
        {
            std::lock_guard lock(completed_mutex_);
            completed_.push_back({id, std::move(result)});
        }
        notify_();
    });
    if (!queued) {
        return error_response({ErrorCode::InferenceFailed, "service is shutting down"});
    }

    log(std::format("Request {}: transcribing {}", req.id, audio));
    pending_.push_back(std::move(req));
    return {{"status", "transcribing"}};
}

nlohmann::json DaemonCore::handle_submit(const nlohmann::json& cmd) {
    auto id = cmd.value("id", std::string{});
    auto audio = cmd.value("audio", std::string{});
    auto language = cmd.value("language", std::string{});
    if (language.empty()) language = config_.backend.language;

    auto res = orchestrator_->submit(id, audio, language);
    if (!res) return error_response(res.error());

    return {
        {"status", "ok"},
        {"id", res->record.id},
        {"job_status", job_status_name(res->record.status)},
        {"accepted", res->accepted},
    };
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& cmd) {
    auto id = cmd.value("id", std::string{});
    if (id.empty()) return error_response({ErrorCode::InvalidRequest, "job id is required"});

    auto rec = orchestrator_->get_status(id);
    if (!rec) return error_response(rec.error());
    return {{"status", "ok"}, {"job", *rec}};
}

nlohmann::json DaemonCore::handle_health(const nlohmann::json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"backend", engine_->backend_name()},
        {"context", context_state_name(engine_->state())},
        {"healthy", engine_->state() == ContextState::Ready},
        {"reinits", engine_->reinit_count()},
        {"workers", pool_->size()},
        {"active", pool_->active()},
        {"queue_depth", pool_->queue_depth()},
        {"pending_requests", pending_.size()},
    };
}

void DaemonCore::on_transcription_complete() {
    std::vector<CompletedRequest> done;
    {
        std::lock_guard lock(completed_mutex_);
        done.swap(completed_);
    }

    for (auto& c : done) {
        auto it = std::ranges::find_if(pending_, [&c](const PendingRequest& p) {
            return p.id == c.id;
        });
        if (it == pending_.end()) {
            log(std::format("Request {}: finished after the client left or timed out", c.id));
            continue;
        }

        nlohmann::json response;
        if (c.result) {
            auto& r = *c.result;
            log(std::format("Request {}: {:.1f}s audio in {:.1f}s (RTF {:.2f}), {} chars",
                            c.id, r.duration, r.processing_time, r.real_time_factor(),
                            r.text.size()));
            response = result_response(r);
        } else {
            log(std::format("Request {}: failed: {}", c.id, c.result.error().message));
            response = error_response(c.result.error());
        }

        ipc_.send_response(it->client_fd, response);
        pending_.erase(it);
    }
}

void DaemonCore::check_timeouts() {
    auto now = SteadyClock::now();
    std::erase_if(pending_, [&](const PendingRequest& p) {
        if (now < p.deadline(config_.timeout.base_seconds)) return false;

        double budget = calculate_timeout(config_.timeout.base_seconds,
                                          p.audio_duration->load(std::memory_order_acquire));
        std::println(stderr, "Request {} exceeded its {:.0f}s timeout, work continues in background",
                     p.id, budget);
        ipc_.send_response(p.client_fd, error_response({ErrorCode::Timeout, std::format(
            "transcription did not finish within {:.0f}s", budget)}));
        return true;
    });
}

int DaemonCore::next_timeout_ms() const {
    if (pending_.empty()) return -1;

    auto nearest = SteadyClock::time_point::max();
    for (auto& p : pending_) {
        nearest = std::min(nearest, p.deadline(config_.timeout.base_seconds));
    }
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(nearest - SteadyClock::now()).count();
    return static_cast<int>(std::clamp<long long>(ms, 0, 60'000));
}

void DaemonCore::remove_waiting_client(int fd) {
    std::erase_if(pending_, [fd](const PendingRequest& p) { return p.client_fd == fd; });
}

void DaemonCore::shutdown() {
    if (pool_) {
        if (!pending_.empty() || pool_->active() > 0 || pool_->queue_depth() > 0) {
            log("Waiting for in-flight transcriptions to complete...");
        }
        pool_->shutdown();
    }
    on_transcription_complete();
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperd] {}", msg);
    }
}
