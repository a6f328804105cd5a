#include "namewise/name_rewriter.hpp"
#include <cctype>

namespace namewise {

namespace {

// Character classes the snake_case rules look at. Bytes outside ASCII are
// treated as lowercase letters so UTF-8 sequences pass through intact.
enum class char_class {
    none,
    upper,
    lower,
    digit,
    separator
};

char_class classify(unsigned char c) {
    if (c >= 0x80) return char_class::lower;
    if (std::isupper(c)) return char_class::upper;
    if (std::islower(c)) return char_class::lower;
    if (std::isdigit(c)) return char_class::digit;
    return char_class::separator;
}

} // namespace

std::string snake_case_rewriter::rewrite_name(const std::string& name) const {
    std::string result;
    result.reserve(name.size() + name.size() / 2);

    auto previous = char_class::none;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);

        if (c == '_') {
            result += '_';
            previous = char_class::none;
            continue;
        }

        auto current = classify(c);
        switch (current) {
            case char_class::upper: {
                bool next_is_lower = i + 1 < name.size() &&
                                     classify(static_cast<unsigned char>(name[i + 1])) == char_class::lower;
                if (previous == char_class::separator ||
                    previous == char_class::lower ||
                    (previous != char_class::digit && previous != char_class::none && next_is_lower)) {
                    result += '_';
                }
                result += static_cast<char>(std::tolower(c));
                break;
            }
            case char_class::lower:
            case char_class::digit:
                if (previous == char_class::separator) {
                    result += '_';
                }
                result += static_cast<char>(c);
                break;
            default:
                // Spaces and punctuation are dropped; they only separate words.
                if (previous != char_class::none) {
                    previous = char_class::separator;
                }
                continue;
        }
        previous = current;
    }
    return result;
}

std::string upper_snake_case_rewriter::rewrite_name(const std::string& name) const {
    auto result = snake_case_.rewrite_name(name);
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string lower_case_rewriter::rewrite_name(const std::string& name) const {
    std::string result = name;
    for (auto& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string upper_case_rewriter::rewrite_name(const std::string& name) const {
    std::string result = name;
    for (auto& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

std::string camel_case_rewriter::rewrite_name(const std::string& name) const {
    if (name.empty()) return name;
    std::string result = name;
    result[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(result[0])));
    return result;
}

const char* to_string(naming_convention convention) {
    switch (convention) {
        case naming_convention::snake_case: return "snake_case";
        case naming_convention::upper_snake_case: return "upper_snake_case";
        case naming_convention::lower_case: return "lower_case";
        case naming_convention::upper_case: return "upper_case";
        case naming_convention::camel_case: return "camel_case";
    }
    return "snake_case";
}

std::optional<naming_convention> naming_convention_from_string(const std::string& name) {
    for (auto convention : {naming_convention::snake_case,
                            naming_convention::upper_snake_case,
                            naming_convention::lower_case,
                            naming_convention::upper_case,
                            naming_convention::camel_case}) {
        if (name == to_string(convention)) return convention;
    }
    return std::nullopt;
}

std::shared_ptr<const name_rewriter> make_rewriter(naming_convention convention) {
    switch (convention) {
        case naming_convention::snake_case: return std::make_shared<snake_case_rewriter>();
        case naming_convention::upper_snake_case: return std::make_shared<upper_snake_case_rewriter>();
        case naming_convention::lower_case: return std::make_shared<lower_case_rewriter>();
        case naming_convention::upper_case: return std::make_shared<upper_case_rewriter>();
        case naming_convention::camel_case: return std::make_shared<camel_case_rewriter>();
    }
    return std::make_shared<snake_case_rewriter>();
}

} // namespace namewise
