#include "value_parsers.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "raw_config.h"

namespace pulsetrace::config::detail {

bool parse_bool(const std::string& text, bool& out) {
    std::string lowered = sanitize_string_value(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") {
        out = true;
        return true;
    }
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") {
        out = false;
        return true;
    }
    return false;
}

bool parse_int32(const std::string& text, int& out) {
    const std::string cleaned = sanitize_string_value(text);
    try {
        std::size_t processed = 0;
        const long long value = std::stoll(cleaned, &processed, 10);
        if (processed != cleaned.size() ||
            value < std::numeric_limits<int>::min() ||
            value > std::numeric_limits<int>::max()) {
            return false;
        }
        out = static_cast<int>(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_float64(const std::string& text, double& out) {
    const std::string cleaned = sanitize_string_value(text);
    try {
        std::size_t processed = 0;
        const double value = std::stod(cleaned, &processed);
        if (processed != cleaned.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_float32(const std::string& text, float& out) {
    double value = 0.0;
    if (!parse_float64(text, value)) {
        return false;
    }
    if (std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
    }
    out = static_cast<float>(value);
    return true;
}

bool parse_color(const std::string& text, std::uint32_t& out) {
    std::string cleaned = sanitize_string_value(text);
    int base = 0;
    if (!cleaned.empty() && cleaned.front() == '#') {
        cleaned.erase(0, 1);
        base = 16;
    }
    if (cleaned.empty() || cleaned.front() == '-') {
        return false;
    }
    try {
        std::size_t processed = 0;
        const unsigned long long raw = std::stoull(cleaned, &processed, base);
        if (processed != cleaned.size() || raw > std::numeric_limits<std::uint32_t>::max()) {
            return false;
        }
        out = static_cast<std::uint32_t>(raw);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace pulsetrace::config::detail
