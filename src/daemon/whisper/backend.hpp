#pragma once

#include "errors.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

enum class ContextState { Uninitialized, Ready, Corrupted };

inline std::string_view context_state_name(ContextState s) {
    switch (s) {
        case ContextState::Uninitialized: return "uninitialized";
        case ContextState::Ready: return "ready";
        case ContextState::Corrupted: return "corrupted";
    }
    return "unknown";
}

// One loaded inference context. Implementations are not reentrant; callers
// serialize access (see TranscriptionEngine).
class WhisperBackend {
public:
    using Deadline = std::chrono::steady_clock::time_point;

    virtual ~WhisperBackend() = default;

    virtual std::string_view name() const = 0;
    virtual ContextState state() const = 0;

    // Creates a fresh context, releasing any previous one.
    virtual std::expected<void, Error> load() = 0;

    virtual std::expected<std::string, Error>
        transcribe(std::span<const float> audio, uint32_t sample_rate,
                   const std::string& language, Deadline deadline) = 0;
};
