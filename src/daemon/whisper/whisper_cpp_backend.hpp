#pragma once

#include "backend.hpp"

#include <atomic>
#include <string>

struct whisper_context;

// In-process whisper.cpp context.
class WhisperCppBackend : public WhisperBackend {
public:
    WhisperCppBackend(std::string model_path, int n_threads, bool use_gpu = false,
                      bool verbose = false);
    ~WhisperCppBackend() override;

    WhisperCppBackend(const WhisperCppBackend&) = delete;
    WhisperCppBackend& operator=(const WhisperCppBackend&) = delete;

    std::string_view name() const override { return "whisper"; }
    ContextState state() const override { return state_.load(std::memory_order_acquire); }

    std::expected<void, Error> load() override;

    std::expected<std::string, Error>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const std::string& language, Deadline deadline) override;

private:
    void release();

    std::string model_path_;
    int n_threads_;
    bool use_gpu_;
    whisper_context* ctx_ = nullptr;
    std::atomic<ContextState> state_{ContextState::Uninitialized};
};
