/**
 * @file pg_format.hpp
 * @brief Text-format encoders for PostgreSQL parameters
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace Cerebrum {

namespace pg {

/// text[] literal, e.g. {"a","b \"c\""}
std::string text_array(const std::vector<std::string>& values);

/// pgvector literal, e.g. [0.1,0.2]
std::string vector_literal(const std::vector<float>& values);

/// Text bool "t"/"f" as returned by libpq
inline bool as_bool(const std::string& value) { return value == "t" || value == "true"; }

/// Empty string → nullopt (used with COALESCE(col, '') selects)
inline std::optional<std::string> nullable(const std::string& value) {
    if (value.empty()) return std::nullopt;
    return value;
}

/// SELECT expression rendering a timestamptz column as ISO-8601 UTC with milliseconds
std::string iso_column(const std::string& column);

} // namespace pg

} // namespace Cerebrum
