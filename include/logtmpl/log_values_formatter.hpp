#pragma once

#include <logtmpl/config.hpp>
#include <logtmpl/result.hpp>
#include <logtmpl/template_parser.hpp>
#include <logtmpl/value.hpp>
#include <mutex>
#include <string>
#include <vector>

namespace logtmpl {

// A placeholder name paired with the argument supplied for it.
struct NamedValue {
    std::string name;
    Value value;

    bool operator==(const NamedValue& o) const { return name == o.name && value == o.value; }
    bool operator!=(const NamedValue& o) const { return !(*this == o); }
};

// Wraps one message template such as "User {UserId} logged in from {Ip}".
// The template is parsed once, on first use, and the result is shared by
// every later call; concurrent first calls are safe.
class LogValuesFormatter {
public:
    explicit LogValuesFormatter(std::string format, FormatterOptions options = {});

    LogValuesFormatter(const LogValuesFormatter&) = delete;
    LogValuesFormatter& operator=(const LogValuesFormatter&) = delete;

    const std::string& original_format() const { return original_format_; }
    const FormatterOptions& options() const { return options_; }

    // Placeholder names in order of appearance, repeats included.
    const std::vector<std::string>& value_names() const;

    // The template with each name replaced by its slot index.
    const std::string& canonical_format() const;

    // Render against positional arguments. Null arguments print as the null
    // marker and lists as their joined elements. Fails with OutOfRange when
    // a slot has no argument.
    Result<std::string> format(const std::vector<Value>& values) const;
    Result<std::string> format() const;

    // Pair at `index`. index == value_names().size() yields the
    // original-format pair; anything outside [0, size] is OutOfRange.
    Result<NamedValue> get_value(const std::vector<Value>& values, int index) const;

    // Every name/argument pair followed by the original-format pair.
    Result<std::vector<NamedValue>> get_values(const std::vector<Value>& values) const;

private:
    const ParsedTemplate& parsed() const;
    NamedValue original_format_pair() const;
    std::vector<Value> prepare(const std::vector<Value>& values) const;

    std::string original_format_;
    FormatterOptions options_;
    mutable std::once_flag parse_once_;
    mutable ParsedTemplate parsed_;
};

} // namespace logtmpl
