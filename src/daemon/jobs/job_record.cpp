#include "job_record.hpp"

#include <stdexcept>

std::string_view job_status_name(JobStatus s) {
    switch (s) {
        case JobStatus::Processing: return "PROCESSING";
        case JobStatus::Completed: return "COMPLETED";
        case JobStatus::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

std::optional<JobStatus> parse_job_status(std::string_view s) {
    if (s == "PROCESSING") return JobStatus::Processing;
    if (s == "COMPLETED") return JobStatus::Completed;
    if (s == "FAILED") return JobStatus::Failed;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const JobRecord& r) {
    j = {
        {"id", r.id},
        {"status", job_status_name(r.status)},
        {"audio", r.audio},
        {"language", r.language},
        {"created_at", r.created_at},
    };
    if (r.transcription) j["transcription"] = *r.transcription;
    if (r.duration) j["duration"] = *r.duration;
    if (r.confidence) j["confidence"] = *r.confidence;
    if (r.processing_time) j["processing_time"] = *r.processing_time;
    if (r.error) j["error"] = *r.error;
    if (r.error_code) j["error_code"] = *r.error_code;
    if (r.finished_at) j["finished_at"] = *r.finished_at;
}

void from_json(const nlohmann::json& j, JobRecord& r) {
    j.at("id").get_to(r.id);
    auto status = parse_job_status(j.at("status").get<std::string>());
    if (!status) {
        throw std::invalid_argument("unknown job status: " + j.at("status").get<std::string>());
    }
    r.status = *status;
    r.audio = j.value("audio", "");
    r.language = j.value("language", "");
    r.created_at = j.value("created_at", 0.0);

    auto opt_string = [&j](const char* key) -> std::optional<std::string> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        return j[key].get<std::string>();
    };
    auto opt_double = [&j](const char* key) -> std::optional<double> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        return j[key].get<double>();
    };

    r.transcription = opt_string("transcription");
    r.duration = opt_double("duration");
    r.confidence = opt_double("confidence");
    r.processing_time = opt_double("processing_time");
    r.error = opt_string("error");
    r.error_code = opt_string("error_code");
    r.finished_at = opt_double("finished_at");
}
