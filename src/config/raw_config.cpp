#include "raw_config.h"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

#include <toml++/toml.hpp>

namespace pulsetrace::config::detail {
namespace {

std::string trim(std::string_view sv) {
    std::size_t begin = 0;
    while (begin < sv.size() && std::isspace(static_cast<unsigned char>(sv[begin]))) {
        ++begin;
    }
    std::size_t end = sv.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(sv[end - 1]))) {
        --end;
    }
    return std::string(sv.substr(begin, end - begin));
}

int node_line(const toml::node& node) {
    return static_cast<int>(node.source().begin.line);
}

std::string node_to_string(const toml::node& node) {
    if (auto value = node.value<std::string>()) {
        return *value;
    }
    if (auto value = node.value<bool>()) {
        return *value ? "true" : "false";
    }
    if (auto value = node.value<std::int64_t>()) {
        return std::to_string(*value);
    }
    if (auto value = node.value<double>()) {
        std::ostringstream oss;
        oss.precision(17);
        oss << *value;
        return oss.str();
    }
    std::ostringstream oss;
    oss << toml::default_formatter{node};
    return oss.str();
}

void append_tracer_configs(const toml::array& array,
                           RawConfig& out,
                           std::vector<std::string>& warnings) {
    for (const toml::node& element : array) {
        if (const auto* table = element.as_table()) {
            std::unordered_map<std::string, RawScalar> tracer_map;
            for (const auto& [key, value] : *table) {
                RawScalar scalar;
                scalar.value = node_to_string(value);
                scalar.line = node_line(value);
                tracer_map.emplace(std::string{key.str()}, std::move(scalar));
            }
            out.tracer_configs.push_back(std::move(tracer_map));
        } else {
            std::ostringstream oss;
            oss << "Invalid tracer entry type at line " << node_line(element);
            warnings.push_back(oss.str());
        }
    }
}

void flatten_table(const toml::table& table,
                   const std::string& prefix,
                   RawConfig& out,
                   std::vector<std::string>& warnings) {
    for (const auto& [key, value] : table) {
        const std::string key_str = std::string{key.str()};
        const std::string full_key = prefix.empty() ? key_str : prefix + '.' + key_str;

        if (const auto* child_table = value.as_table()) {
            flatten_table(*child_table, full_key, out, warnings);
            continue;
        }

        if (const auto* array = value.as_array()) {
            if (full_key == "tracers") {
                append_tracer_configs(*array, out, warnings);
            } else {
                std::ostringstream oss;
                oss << "Unexpected array '" << full_key << "' (line " << node_line(*array) << ")";
                warnings.push_back(oss.str());
            }
            continue;
        }

        RawScalar scalar;
        scalar.value = node_to_string(value);
        scalar.line = node_line(value);
        out.scalars[full_key] = std::move(scalar);
    }
}

} // namespace

RawConfig parse_raw_config(const std::string& path,
                           std::vector<std::string>& warnings,
                           bool& loaded_file) {
    RawConfig raw;
    loaded_file = false;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return raw;
    }

    try {
        toml::table parsed = toml::parse_file(path);
        loaded_file = true;
        flatten_table(parsed, std::string{}, raw, warnings);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse '" << path << "': " << err.description()
            << " (line " << err.source().begin.line
            << ", column " << err.source().begin.column << ")";
        warnings.push_back(oss.str());
    }

    return raw;
}

std::string sanitize_string_value(const std::string& value) {
    std::string trimmed = trim(value);
    if (trimmed.length() >= 2) {
        const char first = trimmed.front();
        const char last = trimmed.back();
        if ((first == '\"' && last == '\"') || (first == '\'' && last == '\'')) {
            trimmed = trimmed.substr(1, trimmed.length() - 2);
        }
    }
    return trimmed;
}

} // namespace pulsetrace::config::detail
