#include "lan_backend.hpp"
#include "../json_text.hpp"
#include "../wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

LanBackend::LanBackend(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanBackend::~LanBackend() {
    curl_global_cleanup();
}

std::expected<void, Error> LanBackend::load() {
    state_.store(ContextState::Uninitialized, std::memory_order_release);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorCode::ContextLost, "curl_easy_init failed"});
    }

    std::string sink;
    curl_easy_setopt(curl, CURLOPT_URL, url_.c_str());
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorCode::ContextLost,
            std::string("server unreachable at ") + url_ + ": " + curl_easy_strerror(res)});
    }

    state_.store(ContextState::Ready, std::memory_order_release);
    return {};
}

std::expected<std::string, Error>
LanBackend::transcribe(std::span<const float> audio, uint32_t sample_rate,
                       const std::string& language, Deadline deadline) {
    if (audio.empty()) return std::string{};

    auto remaining = std::chrono::duration_cast<std::chrono::seconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
        return std::unexpected(Error{ErrorCode::Timeout, "no time left for inference call"});
    }

    // Encode to WAV
    auto wav_data = wav::encode(audio, sample_rate);

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorCode::InferenceFailed, "curl_easy_init failed"});
    }

    // Build URL and form based on API format
    std::string endpoint;
    curl_mime* mime = curl_mime_init(curl);
    curl_mimepart* part;

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");

    part = curl_mime_addpart(mime);
    curl_mime_name(part, "response_format");
    curl_mime_data(part, "json", CURL_ZERO_TERMINATED);

    if (api_format_ == "openai") {
        endpoint = url_ + "/v1/audio/transcriptions";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "model");
        curl_mime_data(part, "whisper-1", CURL_ZERO_TERMINATED);
    } else {
        // whisper.cpp server format
        endpoint = url_ + "/inference";

        part = curl_mime_addpart(mime);
        curl_mime_name(part, "temperature");
        curl_mime_data(part, "0.0", CURL_ZERO_TERMINATED);
    }

    if (!language.empty()) {
        part = curl_mime_addpart(mime);
        curl_mime_name(part, "language");
        curl_mime_data(part, language.c_str(), CURL_ZERO_TERMINATED);
    }

    std::string response_body;

    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(remaining.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(Error{ErrorCode::Timeout, "inference call exceeded its deadline"});
    }
    if (res == CURLE_COULDNT_CONNECT || res == CURLE_COULDNT_RESOLVE_HOST) {
        // Force a reconnect before the next call.
        state_.store(ContextState::Corrupted, std::memory_order_release);
    }
    if (res != CURLE_OK) {
        return std::unexpected(Error{ErrorCode::InferenceFailed,
                                     std::string("curl error: ") + curl_easy_strerror(res)});
    }

    // Parse response
    try {
        auto j = json::parse(response_body);
        std::string text;

        if (j.contains("text")) {
            text = j["text"].get<std::string>();
        } else if (j.contains("error")) {
            return std::unexpected(Error{ErrorCode::InferenceFailed,
                                         "server error: " + to_json_text(j["error"])});
        } else {
            return std::unexpected(Error{ErrorCode::InferenceFailed,
                                         "unexpected response: " + response_body});
        }

        // Trim whitespace
        auto start_pos = text.find_first_not_of(" \t\n\r");
        if (start_pos == std::string::npos) return std::string{};
        auto end_pos = text.find_last_not_of(" \t\n\r");
        return text.substr(start_pos, end_pos - start_pos + 1);
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorCode::InferenceFailed,
                                     std::string("JSON parse error: ") + e.what()});
    }
}
