#include "transcription_engine.hpp"

#include <format>
#include <print>

TranscriptionEngine::TranscriptionEngine(std::unique_ptr<WhisperBackend> backend,
                                         std::chrono::seconds call_timeout, bool verbose)
    : backend_(std::move(backend)), call_timeout_(call_timeout), verbose_(verbose) {}

std::expected<void, Error> TranscriptionEngine::init() {
    std::lock_guard lock(mutex_);
    auto res = backend_->load();
    if (res) log(std::format("{} context ready", backend_->name()));
    return res;
}

ContextState TranscriptionEngine::state() const {
    return backend_->state();
}

bool TranscriptionEngine::ensure_healthy(Error& err) {
    if (backend_->state() == ContextState::Ready) return true;

    std::println(stderr, "engine: context is {}, reinitializing",
                 context_state_name(backend_->state()));
    reinits_.fetch_add(1, std::memory_order_relaxed);

    auto res = backend_->load();
    if (!res) {
        err = Error{ErrorCode::ContextLost, "context recovery failed: " + res.error().message};
        std::println(stderr, "engine: {}", err.message);
        return false;
    }
    std::println(stderr, "engine: context reinitialized");
    return true;
}

std::expected<std::string, Error>
TranscriptionEngine::transcribe(const Chunk& chunk, const std::string& language) {
    std::lock_guard lock(mutex_);

    Error err;
    if (!ensure_healthy(err)) return std::unexpected(std::move(err));

    auto deadline = std::chrono::steady_clock::now() + call_timeout_;
    auto start = std::chrono::steady_clock::now();
    auto text = backend_->transcribe(chunk.samples, chunk.sample_rate, language, deadline);
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    if (text) {
        log(std::format("chunk {} ({:.1f}s audio) inferred in {:.2f}s, {} chars",
                        chunk.index, chunk.duration(), elapsed, text->size()));
    }
    return text;
}

void TranscriptionEngine::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisperd] {}", msg);
    }
}
