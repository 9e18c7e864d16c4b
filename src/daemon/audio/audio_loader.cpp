#include "audio_loader.hpp"
#include "../wav_decoder.hpp"

#include <curl/curl.h>
#include <filesystem>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

namespace {

struct FetchState {
    std::vector<uint8_t>* body;
    size_t limit;
    bool overflow = false;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* st = static_cast<FetchState*>(userdata);
    size_t n = size * nmemb;
    if (st->body->size() + n > st->limit) {
        st->overflow = true;
        return 0; // aborts the transfer
    }
    st->body->insert(st->body->end(), ptr, ptr + n);
    return n;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

AudioLoader::AudioLoader(uint32_t sample_rate, size_t max_bytes)
    : sample_rate_(sample_rate), max_bytes_(max_bytes) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

AudioLoader::~AudioLoader() {
    curl_global_cleanup();
}

std::expected<AudioBuffer, Error> AudioLoader::load(const std::string& ref) {
    if (ref.empty()) {
        return std::unexpected(Error{ErrorCode::InvalidRequest, "audio reference is empty"});
    }

    std::expected<std::vector<uint8_t>, Error> bytes;
    if (starts_with(ref, "http://") || starts_with(ref, "https://")) {
        bytes = fetch_url(ref);
    } else if (starts_with(ref, "file://")) {
        bytes = read_file(ref.substr(7));
    } else if (ref.find("://") != std::string::npos) {
        return std::unexpected(Error{ErrorCode::InvalidRequest,
                                     "unsupported audio URL scheme: " + ref});
    } else {
        bytes = read_file(ref);
    }

    if (!bytes) return std::unexpected(bytes.error());
    return decode(*bytes);
}

std::expected<AudioBuffer, Error> AudioLoader::decode(const std::vector<uint8_t>& bytes) const {
    auto audio = wav::decode(bytes);
    if (!audio) return std::unexpected(audio.error());

    if (audio->sample_rate != sample_rate_) {
        return std::unexpected(Error{ErrorCode::UnsupportedFormat, std::format(
            "unsupported sample rate {}Hz (expected {}Hz)", audio->sample_rate, sample_rate_)});
    }
    return audio;
}

std::expected<std::vector<uint8_t>, Error> AudioLoader::read_file(const std::string& path) const {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(Error{ErrorCode::FetchFailed,
                                     "cannot read " + path + ": " + ec.message()});
    }
    if (size > max_bytes_) {
        return std::unexpected(Error{ErrorCode::AudioTooLarge, std::format(
            "file too large: {:.1f}MB > {}MB", size / (1024.0 * 1024.0), max_bytes_ / (1024 * 1024))});
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorCode::FetchFailed, "cannot open " + path});
    }
    std::vector<uint8_t> data(size);
    f.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size));
    if (!f) {
        return std::unexpected(Error{ErrorCode::FetchFailed, "short read from " + path});
    }
    return data;
}

std::expected<std::vector<uint8_t>, Error> AudioLoader::fetch_url(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected(Error{ErrorCode::FetchFailed, "curl_easy_init failed"});
    }

    std::vector<uint8_t> body;
    FetchState state{.body = &body, .limit = max_bytes_};

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 600L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

    CURLcode res = curl_easy_perform(curl);
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    curl_easy_cleanup(curl);

    if (state.overflow) {
        return std::unexpected(Error{ErrorCode::AudioTooLarge, std::format(
            "file too large (streamed): > {}MB", max_bytes_ / (1024 * 1024))});
    }
    if (res != CURLE_OK) {
        std::string msg = std::string("download failed: ") + curl_easy_strerror(res);
        if (http_code >= 400) msg += std::format(" (HTTP {})", http_code);
        return std::unexpected(Error{ErrorCode::FetchFailed, std::move(msg)});
    }
    return body;
}
