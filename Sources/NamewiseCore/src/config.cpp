#include "namewise/config.hpp"
#include "namewise/types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace namewise {

using json = nlohmann::json;

namespace {

log_level log_level_from_string(const std::string& name) {
    for (auto level : {log_level::off, log_level::error, log_level::warn, log_level::info, log_level::debug}) {
        if (name == to_string(level)) return level;
    }
    throw config_error("Unknown log_level '" + name + "'");
}

std::string string_field(const json& j, const char* field) {
    const auto& value = j.at(field);
    if (!value.is_string()) {
        throw config_error(std::string("'") + field + "' must be a string");
    }
    return value.get<std::string>();
}

} // namespace

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

naming_options parse_naming_options(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Invalid naming configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Naming configuration must be a JSON object");
    }

    naming_options options;
    if (j.contains("convention")) {
        auto name = string_field(j, "convention");
        auto convention = naming_convention_from_string(name);
        if (!convention) {
            throw config_error("Unknown naming convention '" + name + "'");
        }
        options.convention = *convention;
    }
    if (j.contains("log_level")) {
        options.level = log_level_from_string(string_field(j, "log_level"));
    }
    return options;
}

naming_options load_naming_options(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw config_error("Cannot open naming configuration '" + path + "'");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_naming_options(buffer.str());
}

} // namespace namewise
