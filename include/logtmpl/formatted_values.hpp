#pragma once

#include <logtmpl/log_values_formatter.hpp>
#include <memory>
#include <string>
#include <vector>

namespace logtmpl {

// Read-only view of one log call: a shared formatter plus the arguments
// supplied for it. size() counts the original-format pair.
class FormattedValues {
public:
    // Text rendered and reported for a view without a template.
    static constexpr const char* kNullFormat = "[null]";

    FormattedValues(std::shared_ptr<const LogValuesFormatter> formatter,
                    std::vector<Value> values);

    size_t size() const;
    Result<NamedValue> at(size_t index) const;
    Result<std::vector<NamedValue>> pairs() const;
    Result<std::string> to_string() const;

    const std::vector<Value>& values() const { return values_; }

private:
    std::shared_ptr<const LogValuesFormatter> formatter_;
    std::vector<Value> values_;
};

} // namespace logtmpl
