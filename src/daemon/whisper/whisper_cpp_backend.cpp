#include "whisper_cpp_backend.hpp"

#include <chrono>
#include <filesystem>
#include <format>
#include <print>
#include <whisper.h>

namespace {

void quiet_log(ggml_log_level level, const char* text, void*) {
    if (level == GGML_LOG_LEVEL_ERROR || level == GGML_LOG_LEVEL_WARN) {
        std::print(stderr, "whisper: {}", text);
    }
}

void verbose_log(ggml_log_level, const char* text, void*) {
    std::print(stderr, "whisper: {}", text);
}

bool abort_when_expired(void* user_data) {
    auto* deadline = static_cast<const WhisperBackend::Deadline*>(user_data);
    return std::chrono::steady_clock::now() >= *deadline;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

} // namespace

WhisperCppBackend::WhisperCppBackend(std::string model_path, int n_threads, bool use_gpu,
                                     bool verbose)
    : model_path_(std::move(model_path)), n_threads_(n_threads), use_gpu_(use_gpu) {
    whisper_log_set(verbose ? verbose_log : quiet_log, nullptr);
}

WhisperCppBackend::~WhisperCppBackend() {
    release();
}

void WhisperCppBackend::release() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
    state_.store(ContextState::Uninitialized, std::memory_order_release);
}

std::expected<void, Error> WhisperCppBackend::load() {
    release();

    if (!std::filesystem::exists(model_path_)) {
        return std::unexpected(Error{ErrorCode::ContextLost,
                                     "model file not found: " + model_path_});
    }

    whisper_context_params cparams = whisper_context_default_params();
    cparams.use_gpu = use_gpu_;

    ctx_ = whisper_init_from_file_with_params(model_path_.c_str(), cparams);
    if (!ctx_) {
        return std::unexpected(Error{ErrorCode::ContextLost,
            "whisper_init_from_file_with_params returned NULL, model may be corrupted: " +
            model_path_});
    }

    state_.store(ContextState::Ready, std::memory_order_release);
    return {};
}

std::expected<std::string, Error>
WhisperCppBackend::transcribe(std::span<const float> audio, uint32_t sample_rate,
                              const std::string& language, Deadline deadline) {
    if (!ctx_ || state() != ContextState::Ready) {
        return std::unexpected(Error{ErrorCode::ContextLost, "whisper context is not ready"});
    }
    if (sample_rate != WHISPER_SAMPLE_RATE) {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat, std::format(
            "whisper expects {}Hz audio, got {}Hz", WHISPER_SAMPLE_RATE, sample_rate)});
    }
    if (audio.empty()) return std::string{};

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads = n_threads_;
    params.language = language.empty() ? "auto" : language.c_str();
    params.translate = false;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.abort_callback = abort_when_expired;
    params.abort_callback_user_data = &deadline;

    int rc = whisper_full(ctx_, params, audio.data(), static_cast<int>(audio.size()));
    if (rc != 0) {
        // A failed or aborted call leaves the decoder state undefined.
        state_.store(ContextState::Corrupted, std::memory_order_release);
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::unexpected(Error{ErrorCode::Timeout,
                                         "inference call exceeded its deadline"});
        }
        return std::unexpected(Error{ErrorCode::InferenceFailed,
                                     std::format("whisper_full returned error code {}", rc)});
    }

    std::string text;
    const int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        auto part = trim(whisper_full_get_segment_text(ctx_, i));
        if (part.empty()) continue;
        if (!text.empty()) text += ' ';
        text += part;
    }
    return text;
}
