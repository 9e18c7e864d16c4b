#pragma once

#include "backend.hpp"

#include <atomic>
#include <string>

// Remote whisper.cpp (or OpenAI-compatible) server reached over HTTP.
class LanBackend : public WhisperBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    LanBackend(std::string url, std::string api_format = "whisper.cpp");
    ~LanBackend() override;

    std::string_view name() const override { return "lan"; }
    ContextState state() const override { return state_.load(std::memory_order_acquire); }

    // Probes the server; any HTTP answer counts as alive.
    std::expected<void, Error> load() override;

    std::expected<std::string, Error>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const std::string& language, Deadline deadline) override;

private:
    std::string url_;
    std::string api_format_;
    std::atomic<ContextState> state_{ContextState::Uninitialized};
};
