#include <NamewiseCore.hpp>
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace namewise;

template<typename Fn>
bool throws_config_error(Fn&& fn) {
    try {
        fn();
    } catch (const config_error&) {
        return true;
    }
    return false;
}

void test_parse_options() {
    std::cout << "Testing naming options parsing..." << std::endl;

    auto options = parse_naming_options(R"({"convention": "upper_snake_case", "log_level": "warn"})");
    assert(options.convention == naming_convention::upper_snake_case);
    assert(options.level == log_level::warn);

    // Both keys are optional
    auto defaults = parse_naming_options("{}");
    assert(defaults.convention == naming_convention::snake_case);
    assert(defaults.level == log_level::off);

    auto camel = parse_naming_options(R"({"convention": "camel_case"})");
    assert(camel.convention == naming_convention::camel_case);
    assert(camel.level == log_level::off);

    std::cout << "  naming options parsing test passed!" << std::endl;
}

void test_invalid_options() {
    std::cout << "Testing invalid naming options..." << std::endl;

    assert(throws_config_error([] { parse_naming_options("{\"convention\": "); }));
    assert(throws_config_error([] { parse_naming_options("[]"); }));
    assert(throws_config_error([] { parse_naming_options(R"({"convention": "kebab_case"})"); }));
    assert(throws_config_error([] { parse_naming_options(R"({"convention": 3})"); }));
    assert(throws_config_error([] { parse_naming_options(R"({"log_level": "verbose"})"); }));

    std::cout << "  invalid naming options test passed!" << std::endl;
}

void test_load_options_file() {
    std::cout << "Testing naming options from a file..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / "namewise_config_test.json";
    {
        std::ofstream out(path);
        out << R"({ "convention": "lower_case", "log_level": "debug" })";
    }

    auto options = load_naming_options(path.string());
    assert(options.convention == naming_convention::lower_case);
    assert(options.level == log_level::debug);
    std::filesystem::remove(path);

    assert(throws_config_error([&] { load_naming_options(path.string()); }));

    std::cout << "  naming options file test passed!" << std::endl;
}

void test_log_level_names() {
    std::cout << "Testing log level names..." << std::endl;

    assert(std::string(to_string(log_level::off)) == "off");
    assert(std::string(to_string(log_level::debug)) == "debug");

    set_log_level(log_level::info);
    assert(get_log_level() == log_level::info);
    set_log_level(log_level::off);

    std::cout << "  log level names test passed!" << std::endl;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_parse_options();
        test_invalid_options();
        test_load_options_file();
        test_log_level_names();

        std::cout << std::endl;
        std::cout << "All tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
