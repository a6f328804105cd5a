#pragma once

#include "log.hpp"
#include "name_rewriter.hpp"
#include <string>

namespace namewise {

// Naming configuration, usually read from JSON:
//
//   { "convention": "snake_case", "log_level": "debug" }
//
// Both keys are optional.
struct naming_options {
    naming_convention convention = naming_convention::snake_case;
    log_level level = log_level::off;
};

/// Throws config_error on malformed JSON, unknown keys' values or wrong types.
naming_options parse_naming_options(const std::string& json_text);

/// Reads and parses a JSON file. Throws config_error if it cannot be read.
naming_options load_naming_options(const std::string& path);

const char* to_string(log_level level);

} // namespace namewise
