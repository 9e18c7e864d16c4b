#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Compact JSON text for the wire and the job store. whisper can split a
// multi-byte character across segments, so invalid UTF-8 is written as
// U+FFFD instead of throwing type_error.316.
inline std::string to_json_text(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}
