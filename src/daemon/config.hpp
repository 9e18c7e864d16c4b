#pragma once

#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <string>

struct Config {
    struct Backend {
        std::string type = "whisper"; // "whisper" (in-process) or "lan"
        std::string model_path;
        bool use_gpu = false;
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        std::string language = "en";
        uint32_t n_threads = 0; // 0 = auto
        uint32_t call_timeout_seconds = 300;

        // Auto-detected thread count is capped at 8.
        uint32_t resolved_threads() const;
    } backend;

    struct Chunking {
        bool enabled = true;
        double duration_seconds = 30.0;
        double overlap_seconds = 3.0;
        double min_final_seconds = 2.0;
    } chunking;

    struct Timeout {
        double base_seconds = 90.0;
    } timeout;

    struct Jobs {
        uint32_t ttl_seconds = 3600;
        uint32_t workers = 2;
        std::string db_path; // empty = <data_dir>/jobs.db
    } jobs;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_upload_mb = 500;

        size_t max_upload_bytes() const {
            return static_cast<size_t>(max_upload_mb) * 1024 * 1024;
        }
    } audio;

    struct Daemon {
        std::string log_file; // empty = <data_dir>/whisperd.log

        // Where stderr goes once detached from the terminal.
        std::string resolved_log_file() const;
    } daemon;

    std::expected<void, Error> validate() const;

    static Config load(const std::string& path);
    static Config load_default();
};
