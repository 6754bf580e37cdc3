#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../config.h"
#include "raw_config.h"

namespace pulsetrace::config::detail {

std::optional<TracerConfig> parse_tracer_config(
    const std::unordered_map<std::string, RawScalar>& raw_tracer_config,
    std::vector<std::string>& warnings);

} // namespace pulsetrace::config::detail
