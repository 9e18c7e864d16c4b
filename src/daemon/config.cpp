#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <thread>

namespace fs = std::filesystem;
using json = nlohmann::json;

uint32_t Config::Backend::resolved_threads() const {
    if (n_threads > 0) return n_threads;
    uint32_t hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    return std::min<uint32_t>(hw, 8);
}

std::string Config::Daemon::resolved_log_file() const {
    if (!log_file.empty()) return log_file;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/whisperd/whisperd.log";
    return data + "/whisperd.log";
}

std::expected<void, Error> Config::validate() const {
    auto invalid = [](std::string msg) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, std::move(msg)});
    };

    if (backend.type != "whisper" && backend.type != "lan") {
        return invalid("unknown backend type: " + backend.type);
    }
    if (backend.type == "whisper" && backend.model_path.empty()) {
        return invalid("backend.model_path is required for the whisper backend");
    }
    if (chunking.duration_seconds <= 0.0) {
        return invalid("chunking.duration_seconds must be positive");
    }
    if (chunking.overlap_seconds < 0.0) {
        return invalid("chunking.overlap_seconds must not be negative");
    }
    if (chunking.overlap_seconds >= chunking.duration_seconds / 2) {
        return invalid(std::format(
            "chunking.overlap_seconds ({}s) must be less than half of "
            "chunking.duration_seconds ({}s / 2 = {}s)",
            chunking.overlap_seconds, chunking.duration_seconds,
            chunking.duration_seconds / 2));
    }
    if (timeout.base_seconds <= 0.0) {
        return invalid("timeout.base_seconds must be positive");
    }
    if (jobs.ttl_seconds == 0) {
        return invalid("jobs.ttl_seconds must be positive");
    }
    if (jobs.workers == 0) {
        return invalid("jobs.workers must be at least 1");
    }
    if (audio.sample_rate == 0) {
        return invalid("audio.sample_rate must be positive");
    }
    return {};
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            if (b.contains("type")) cfg.backend.type = b["type"].get<std::string>();
            if (b.contains("model_path")) cfg.backend.model_path = b["model_path"].get<std::string>();
            if (b.contains("use_gpu")) cfg.backend.use_gpu = b["use_gpu"].get<bool>();
            if (b.contains("url")) cfg.backend.url = b["url"].get<std::string>();
            if (b.contains("api_format")) cfg.backend.api_format = b["api_format"].get<std::string>();
            if (b.contains("language")) cfg.backend.language = b["language"].get<std::string>();
            if (b.contains("n_threads")) cfg.backend.n_threads = b["n_threads"].get<uint32_t>();
            if (b.contains("call_timeout_seconds")) {
                cfg.backend.call_timeout_seconds = b["call_timeout_seconds"].get<uint32_t>();
            }
        }

        if (j.contains("chunking")) {
            auto& c = j["chunking"];
            if (c.contains("enabled")) cfg.chunking.enabled = c["enabled"].get<bool>();
            if (c.contains("duration_seconds")) cfg.chunking.duration_seconds = c["duration_seconds"].get<double>();
            if (c.contains("overlap_seconds")) cfg.chunking.overlap_seconds = c["overlap_seconds"].get<double>();
            if (c.contains("min_final_seconds")) cfg.chunking.min_final_seconds = c["min_final_seconds"].get<double>();
        }

        if (j.contains("timeout")) {
            auto& t = j["timeout"];
            if (t.contains("base_seconds")) cfg.timeout.base_seconds = t["base_seconds"].get<double>();
        }

        if (j.contains("jobs")) {
            auto& jb = j["jobs"];
            if (jb.contains("ttl_seconds")) cfg.jobs.ttl_seconds = jb["ttl_seconds"].get<uint32_t>();
            if (jb.contains("workers")) cfg.jobs.workers = jb["workers"].get<uint32_t>();
            if (jb.contains("db_path")) cfg.jobs.db_path = jb["db_path"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("max_upload_mb")) cfg.audio.max_upload_mb = a["max_upload_mb"].get<uint32_t>();
        }

        if (j.contains("daemon")) {
            auto& d = j["daemon"];
            if (d.contains("log_file")) cfg.daemon.log_file = d["log_file"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
