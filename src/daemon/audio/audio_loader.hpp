#pragma once

#include "audio_buffer.hpp"
#include "errors.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

// Resolves an audio reference (path, file:// or http(s):// URL) to decoded PCM.
class AudioLoader {
public:
    AudioLoader(uint32_t sample_rate, size_t max_bytes);
    virtual ~AudioLoader();

    AudioLoader(const AudioLoader&) = delete;
    AudioLoader& operator=(const AudioLoader&) = delete;

    virtual std::expected<AudioBuffer, Error> load(const std::string& ref);

    // Decodes WAV bytes and enforces the expected sample rate.
    std::expected<AudioBuffer, Error> decode(const std::vector<uint8_t>& bytes) const;

private:
    std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path) const;
    std::expected<std::vector<uint8_t>, Error> fetch_url(const std::string& url) const;

    uint32_t sample_rate_;
    size_t max_bytes_;
};
