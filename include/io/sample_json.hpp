#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/raw_sample.hpp"

namespace crowd_ews::io {

// Decodes one collector reading. Measurement fields that are absent or not
// numeric decode as empty optionals; the timestamp (ISO-8601 string or epoch
// milliseconds) is required and its absence throws std::invalid_argument.
// Column names of the dashboard CSV export (temp_c, rh, ATI, ...) are accepted
// as aliases.
model::raw_sample parse_raw_sample(const nlohmann::json& document);

// As above from a single JSON-lines record.
model::raw_sample parse_raw_sample_line(const std::string& line);

}  // namespace crowd_ews::io
