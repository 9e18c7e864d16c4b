#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "wd_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        ::write(fd, content.data(), content.size());
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.backend.type == "whisper");
        REQUIRE(cfg.backend.url == "http://localhost:8080");
        REQUIRE(cfg.backend.language == "en");
        REQUIRE(cfg.backend.n_threads == 0);
        REQUIRE(cfg.backend.call_timeout_seconds == 300);
        REQUIRE(cfg.chunking.enabled);
        REQUIRE(cfg.chunking.duration_seconds == 30.0);
        REQUIRE(cfg.chunking.overlap_seconds == 3.0);
        REQUIRE(cfg.timeout.base_seconds == 90.0);
        REQUIRE(cfg.jobs.ttl_seconds == 3600);
        REQUIRE(cfg.audio.sample_rate == 16000);
        REQUIRE(cfg.audio.max_upload_bytes() == 500u * 1024 * 1024);
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "backend": {
                "type": "lan",
                "url": "http://10.0.0.1:9090",
                "api_format": "openai",
                "language": "de",
                "n_threads": 6,
                "call_timeout_seconds": 120
            },
            "chunking": { "enabled": false, "duration_seconds": 20, "overlap_seconds": 2 },
            "timeout": { "base_seconds": 30 },
            "jobs": { "ttl_seconds": 600, "workers": 4, "db_path": "/tmp/jobs.db" },
            "audio": { "sample_rate": 8000, "max_upload_mb": 10 },
            "daemon": { "log_file": "/var/log/whisperd.log" }
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.type == "lan");
        REQUIRE(cfg.backend.url == "http://10.0.0.1:9090");
        REQUIRE(cfg.backend.api_format == "openai");
        REQUIRE(cfg.backend.language == "de");
        REQUIRE(cfg.backend.n_threads == 6);
        REQUIRE(cfg.backend.call_timeout_seconds == 120);
        REQUIRE_FALSE(cfg.chunking.enabled);
        REQUIRE(cfg.chunking.duration_seconds == 20.0);
        REQUIRE(cfg.chunking.overlap_seconds == 2.0);
        REQUIRE(cfg.timeout.base_seconds == 30.0);
        REQUIRE(cfg.jobs.ttl_seconds == 600);
        REQUIRE(cfg.jobs.workers == 4);
        REQUIRE(cfg.jobs.db_path == "/tmp/jobs.db");
        REQUIRE(cfg.audio.sample_rate == 8000);
        REQUIRE(cfg.audio.max_upload_mb == 10);
        REQUIRE(cfg.daemon.resolved_log_file() == "/var/log/whisperd.log");
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "backend": { "language": "fr" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.backend.language == "fr");
        // Other fields retain defaults
        REQUIRE(cfg.backend.type == "whisper");
        REQUIRE(cfg.chunking.duration_seconds == 30.0);
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.backend.type == "whisper");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/wd_test_nonexistent_config_file.json");
        REQUIRE(cfg.backend.type == "whisper");
        REQUIRE(cfg.audio.sample_rate == 16000);
    }

    SECTION("DefaultLogFileUnderDataDir") {
        const char* old = std::getenv("XDG_DATA_HOME");
        std::string saved = old ? old : "";
        setenv("XDG_DATA_HOME", "/tmp/wd_test_data", 1);

        Config cfg;
        REQUIRE(cfg.daemon.resolved_log_file() == "/tmp/wd_test_data/whisperd/whisperd.log");

        if (old) setenv("XDG_DATA_HOME", saved.c_str(), 1);
        else unsetenv("XDG_DATA_HOME");
    }

    SECTION("ResolvedThreads") {
        Config cfg;
        cfg.backend.n_threads = 3;
        REQUIRE(cfg.backend.resolved_threads() == 3);
        cfg.backend.n_threads = 0;
        REQUIRE(cfg.backend.resolved_threads() >= 1);
        REQUIRE(cfg.backend.resolved_threads() <= 8);
    }
}

TEST_CASE("Config::validate", "[config]") {
    Config cfg;
    cfg.backend.model_path = "/models/ggml-base.en.bin";
    REQUIRE(cfg.validate().has_value());

    SECTION("OverlapMustBeUnderHalfTheChunk") {
        cfg.chunking.duration_seconds = 30;
        cfg.chunking.overlap_seconds = 15;
        auto res = cfg.validate();
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code == ErrorCode::InvalidConfig);
        REQUIRE(res.error().message.find("overlap") != std::string::npos);

        cfg.chunking.overlap_seconds = 14.9;
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("NegativeOverlap") {
        cfg.chunking.overlap_seconds = -1;
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("WhisperBackendNeedsModel") {
        cfg.backend.model_path.clear();
        REQUIRE_FALSE(cfg.validate().has_value());
        cfg.backend.type = "lan";
        REQUIRE(cfg.validate().has_value());
    }

    SECTION("UnknownBackend") {
        cfg.backend.type = "cloud";
        REQUIRE_FALSE(cfg.validate().has_value());
    }

    SECTION("ZeroValues") {
        Config a = cfg;
        a.timeout.base_seconds = 0;
        REQUIRE_FALSE(a.validate().has_value());

        Config b = cfg;
        b.jobs.ttl_seconds = 0;
        REQUIRE_FALSE(b.validate().has_value());

        Config c = cfg;
        c.jobs.workers = 0;
        REQUIRE_FALSE(c.validate().has_value());
    }
}
