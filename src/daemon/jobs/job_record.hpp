#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class JobStatus { Processing, Completed, Failed };

std::string_view job_status_name(JobStatus s);
std::optional<JobStatus> parse_job_status(std::string_view s);

struct JobRecord {
    std::string id;
    JobStatus status = JobStatus::Processing;
    std::string audio;
    std::string language;
    double created_at = 0.0; // unix seconds

    std::optional<std::string> transcription;
    std::optional<double> duration;
    std::optional<double> confidence;
    std::optional<double> processing_time;
    std::optional<std::string> error;
    std::optional<std::string> error_code;
    std::optional<double> finished_at;
};

// nlohmann ADL hooks. from_json throws json::exception on missing or mistyped
// fields and std::invalid_argument on an unknown status.
void to_json(nlohmann::json& j, const JobRecord& r);
void from_json(const nlohmann::json& j, JobRecord& r);
