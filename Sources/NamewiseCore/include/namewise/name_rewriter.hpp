#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace namewise {

// Maps a raw identifier to its rewritten form. Implementations must be pure:
// the same input always yields the same output.
class name_rewriter {
public:
    virtual ~name_rewriter() = default;
    virtual std::string rewrite_name(const std::string& name) const = 0;
};

// FullName -> full_name, HTMLParser -> html_parser, Person_Street -> person_street
class snake_case_rewriter : public name_rewriter {
public:
    std::string rewrite_name(const std::string& name) const override;
};

// FullName -> FULL_NAME
class upper_snake_case_rewriter : public name_rewriter {
public:
    std::string rewrite_name(const std::string& name) const override;

private:
    snake_case_rewriter snake_case_;
};

// FullName -> fullname
class lower_case_rewriter : public name_rewriter {
public:
    std::string rewrite_name(const std::string& name) const override;
};

// FullName -> FULLNAME
class upper_case_rewriter : public name_rewriter {
public:
    std::string rewrite_name(const std::string& name) const override;
};

// FullName -> fullName
class camel_case_rewriter : public name_rewriter {
public:
    std::string rewrite_name(const std::string& name) const override;
};

// Adapts any callable.
class function_rewriter : public name_rewriter {
public:
    using function_t = std::function<std::string(const std::string&)>;

    explicit function_rewriter(function_t fn) : fn_(std::move(fn)) {}

    std::string rewrite_name(const std::string& name) const override { return fn_(name); }

private:
    function_t fn_;
};

enum class naming_convention {
    snake_case,
    upper_snake_case,
    lower_case,
    upper_case,
    camel_case
};

const char* to_string(naming_convention convention);
std::optional<naming_convention> naming_convention_from_string(const std::string& name);

std::shared_ptr<const name_rewriter> make_rewriter(naming_convention convention);

} // namespace namewise
