#include <logtmpl/formatted_values.hpp>
#include <climits>

namespace logtmpl {

FormattedValues::FormattedValues(std::shared_ptr<const LogValuesFormatter> formatter,
                                 std::vector<Value> values)
    : formatter_(std::move(formatter)), values_(std::move(values)) {}

size_t FormattedValues::size() const {
    if (!formatter_) return 1;
    return formatter_->value_names().size() + 1;
}

Result<NamedValue> FormattedValues::at(size_t index) const {
    if (!formatter_) {
        if (index != 0) {
            return TemplateError{TemplateError::OutOfRange,
                "index " + std::to_string(index) + " is out of range",
                "a view without a template holds only index 0"};
        }
        return Result<NamedValue>::ok(
            NamedValue{FormatterOptions{}.original_format_key, Value(kNullFormat)});
    }
    if (index > static_cast<size_t>(INT_MAX)) {
        return TemplateError{TemplateError::OutOfRange,
            "index " + std::to_string(index) + " is out of range"};
    }
    return formatter_->get_value(values_, static_cast<int>(index));
}

Result<std::vector<NamedValue>> FormattedValues::pairs() const {
    std::vector<NamedValue> out;
    out.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        auto pair = at(i);
        LOGTMPL_TRY(pair);
        out.push_back(std::move(pair).value());
    }
    return Result<std::vector<NamedValue>>::ok(std::move(out));
}

Result<std::string> FormattedValues::to_string() const {
    if (!formatter_) return Result<std::string>::ok(kNullFormat);
    return formatter_->format(values_);
}

} // namespace logtmpl
