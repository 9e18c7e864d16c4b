#pragma once

#include "audio/audio_buffer.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <cmath>
#include <functional>
#include <mutex>
#include <numbers>
#include <thread>
#include <vector>

// Scriptable backend that records how it is called.
class MockBackend : public WhisperBackend {
public:
    // Receives the zero-based call number.
    using Script = std::function<std::expected<std::string, Error>(size_t call)>;

    std::string_view name() const override { return "mock"; }
    ContextState state() const override { return state_.load(); }

    std::expected<void, Error> load() override {
        loads++;
        if (fail_load.load()) {
            state_.store(ContextState::Uninitialized);
            return std::unexpected(Error{ErrorCode::ContextLost, "mock load failure"});
        }
        state_.store(ContextState::Ready);
        return {};
    }

    std::expected<std::string, Error>
    transcribe(std::span<const float> audio, uint32_t, const std::string& language,
               Deadline) override {
        int now = ++in_flight;
        int prev = max_in_flight.load();
        while (now > prev && !max_in_flight.compare_exchange_weak(prev, now)) {}

        if (delay.count() > 0) std::this_thread::sleep_for(delay);

        size_t call = calls++;
        {
            std::lock_guard lock(mutex_);
            sample_counts.push_back(audio.size());
            languages.push_back(language);
        }

        std::expected<std::string, Error> result = std::string("chunk") + std::to_string(call);
        if (script) result = script(call);

        --in_flight;
        return result;
    }

    void corrupt() { state_.store(ContextState::Corrupted); }

    Script script;
    std::chrono::milliseconds delay{0};
    std::atomic<bool> fail_load{false};
    std::atomic<int> loads{0};
    std::atomic<size_t> calls{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};

    std::mutex mutex_;
    std::vector<size_t> sample_counts;
    std::vector<std::string> languages;

private:
    std::atomic<ContextState> state_{ContextState::Uninitialized};
};

inline AudioBuffer make_tone(double seconds, uint32_t sample_rate = 16000, float amplitude = 0.5f) {
    AudioBuffer buf;
    buf.sample_rate = sample_rate;
    buf.samples.resize(static_cast<size_t>(seconds * sample_rate));
    for (size_t i = 0; i < buf.samples.size(); ++i) {
        buf.samples[i] = amplitude * static_cast<float>(
            std::sin(2.0 * std::numbers::pi * 440.0 * static_cast<double>(i) / sample_rate));
    }
    return buf;
}

inline AudioBuffer make_silence(double seconds, uint32_t sample_rate = 16000) {
    AudioBuffer buf;
    buf.sample_rate = sample_rate;
    buf.samples.assign(static_cast<size_t>(seconds * sample_rate), 0.0f);
    return buf;
}
