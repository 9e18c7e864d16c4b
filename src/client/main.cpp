#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  transcribe <audio> [--language L]     Transcribe and wait for the text");
    std::println(stderr, "  submit <id> <audio> [--language L]    Queue a background job");
    std::println(stderr, "  status <id>                           Show a job record");
    std::println(stderr, "  wait <id> [--interval S]              Poll a job until it finishes");
    std::println(stderr, "  health                                Show engine and worker state");
    std::println(stderr, "Options:");
    std::println(stderr, "  --timeout S    Give up waiting for a reply after S seconds");
    std::println(stderr, "  --json         Print the raw response");
}

// Local paths are resolved here because the daemon may run in another directory.
static std::string resolve_audio_ref(const std::string& ref) {
    if (ref.find("://") != std::string::npos) return ref;
    std::error_code ec;
    auto abs = std::filesystem::absolute(ref, ec);
    return ec ? ref : abs.string();
}

static bool request(const json& cmd, json& response, int timeout_ms) {
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (int err = client.connect(sock_path); err != 0) {
        std::println(stderr, "Failed to connect to whisperd at {}: {}", sock_path,
                     std::strerror(err));
        std::println(stderr, "Is whisperd running?");
        return false;
    }
    if (auto status = client.request(cmd, response, timeout_ms); status != RecvStatus::Ok) {
        std::println(stderr, "No reply: {}", recv_status_name(status));
        return false;
    }
    return true;
}

static int print_error(const json& response) {
    std::println(stderr, "Error ({}{}): {}", response.value("code", "unknown"),
                 response.value("transient", false) ? ", transient" : "",
                 response.value("message", "unknown error"));
    return 1;
}

static void print_job(const json& job) {
    std::println("Job:      {}", job.value("id", ""));
    std::println("Status:   {}", job.value("status", ""));
    if (job.contains("duration")) {
        std::println("Duration: {:.1f}s", job["duration"].get<double>());
    }
    if (job.contains("processing_time")) {
        std::println("Took:     {:.1f}s", job["processing_time"].get<double>());
    }
    if (job.contains("error")) {
        std::println("Error:    {}", job["error"].get<std::string>());
    }
    if (job.contains("transcription")) {
        std::println("");
        std::println("{}", job["transcription"].get<std::string>());
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string language;
    int timeout_ms = -1;
    double interval = 2.0;
    bool raw = false;
    std::vector<std::string> positional;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--timeout" && i + 1 < argc) {
            timeout_ms = std::atoi(argv[++i]) * 1000;
        } else if (arg == "--interval" && i + 1 < argc) {
            interval = std::atof(argv[++i]);
        } else if (arg == "--json") {
            raw = true;
        } else {
            positional.push_back(arg);
        }
    }

    auto need = [&](size_t n) {
        if (positional.size() >= n) return true;
        usage(argv[0]);
        return false;
    };

    // Build command JSON
    json cmd;
    if (command == "transcribe") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "transcribe"}, {"audio", resolve_audio_ref(positional[0])}};
    } else if (command == "submit") {
        if (!need(2)) return 1;
        cmd = {{"cmd", "submit"}, {"id", positional[0]},
               {"audio", resolve_audio_ref(positional[1])}};
    } else if (command == "status" || command == "wait") {
        if (!need(1)) return 1;
        cmd = {{"cmd", "status"}, {"id", positional[0]}};
    } else if (command == "health") {
        cmd = {{"cmd", "health"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }
    if (!language.empty()) cmd["language"] = language;

    json response;
    if (!request(cmd, response, timeout_ms)) return 1;

    if (command == "wait") {
        while (response.value("status", "") == "ok" &&
               response["job"].value("status", "") == "PROCESSING") {
            std::this_thread::sleep_for(std::chrono::duration<double>(interval));
            if (!request(cmd, response, timeout_ms)) return 1;
        }
    }

    if (raw) {
        std::println("{}", response.dump(2, ' ', false, json::error_handler_t::replace));
        return response.value("status", "") == "ok" ? 0 : 1;
    }

    // Display response
    if (response.value("status", "") == "error") return print_error(response);

    if (command == "transcribe") {
        std::println("{}", response.value("text", ""));
    } else if (command == "submit") {
        std::println("{} {} ({})", response.value("id", ""), response.value("job_status", ""),
                     response.value("accepted", false) ? "accepted" : "existing job");
    } else if (command == "status" || command == "wait") {
        print_job(response["job"]);
        if (command == "wait" && response["job"].value("status", "") == "FAILED") return 1;
    } else if (command == "health") {
        std::println("Backend:  {} ({})", response.value("backend", ""), response.value("context", ""));
        std::println("Reinits:  {}", response.value("reinits", 0));
        std::println("Workers:  {} ({} busy, {} queued)", response.value("workers", 0),
                     response.value("active", 0), response.value("queue_depth", 0));
    }

    return 0;
}
