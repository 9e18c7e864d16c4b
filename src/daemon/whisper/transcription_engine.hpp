#pragma once

#include "audio/segmenter.hpp"
#include "backend.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

// Sole owner of the process-wide inference context. Every call into the
// backend happens under one exclusive lock held for the whole call: health
// check, optional reinitialization and inference.
class TranscriptionEngine {
public:
    TranscriptionEngine(std::unique_ptr<WhisperBackend> backend,
                        std::chrono::seconds call_timeout, bool verbose = false);

    TranscriptionEngine(const TranscriptionEngine&) = delete;
    TranscriptionEngine& operator=(const TranscriptionEngine&) = delete;

    // Loads the context once at startup.
    std::expected<void, Error> init();

    // Safe to call from any number of threads; calls are serialized.
    // ContextLost means the context could not be recovered and the caller
    // must not retry within the same request.
    std::expected<std::string, Error> transcribe(const Chunk& chunk, const std::string& language);

    ContextState state() const;
    std::string_view backend_name() const { return backend_->name(); }
    uint64_t reinit_count() const { return reinits_.load(std::memory_order_relaxed); }

private:
    bool ensure_healthy(Error& err);
    void log(const std::string& msg);

    std::unique_ptr<WhisperBackend> backend_;
    std::chrono::seconds call_timeout_;
    bool verbose_;

    std::mutex mutex_;
    std::atomic<uint64_t> reinits_{0};
};
