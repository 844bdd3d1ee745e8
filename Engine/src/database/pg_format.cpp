#include <database/pg_format.hpp>
#include <cstdio>

namespace Cerebrum {

namespace pg {

std::string text_array(const std::vector<std::string>& values) {
    std::string out = "{";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += "}";
    return out;
}

std::string vector_literal(const std::vector<float>& values) {
    std::string out = "[";
    char buf[32];
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ",";
        std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(values[i]));
        out += buf;
    }
    out += "]";
    return out;
}

std::string iso_column(const std::string& column) {
    return "COALESCE(to_char(" + column + " AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS.MS\"Z\"'), '')";
}

} // namespace pg

} // namespace Cerebrum
