// ---------------------------------------------------------------------------
// json_format.cpp
// ---------------------------------------------------------------------------

#include "logger/json_format.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

std::string format_json_string_array(const std::vector<std::string>& items) {
    std::string out{"["};
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '"';
        out += escape_json_string(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}
