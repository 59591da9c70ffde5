#include <logtmpl/log_values_formatter.hpp>
#include <logtmpl/composite_format.hpp>
#include <logtmpl/log.hpp>

namespace logtmpl {

LogValuesFormatter::LogValuesFormatter(std::string format, FormatterOptions options)
    : original_format_(std::move(format)), options_(std::move(options)) {}

const ParsedTemplate& LogValuesFormatter::parsed() const {
    std::call_once(parse_once_, [this] {
        parsed_ = parse_template(original_format_);
    });
    return parsed_;
}

const std::vector<std::string>& LogValuesFormatter::value_names() const {
    return parsed().names;
}

const std::string& LogValuesFormatter::canonical_format() const {
    return parsed().canonical;
}

NamedValue LogValuesFormatter::original_format_pair() const {
    return NamedValue{options_.original_format_key, Value(original_format_)};
}

std::vector<Value> LogValuesFormatter::prepare(const std::vector<Value>& values) const {
    std::vector<Value> prepared;
    prepared.reserve(values.size());
    for (const auto& v : values) {
        if (v.is_null()) {
            prepared.emplace_back(options_.null_marker);
        } else if (v.is_list()) {
            prepared.emplace_back(join_list(v.as_list(), options_.list_separator,
                                            options_.null_marker));
        } else {
            prepared.push_back(v);
        }
    }
    return prepared;
}

Result<std::string> LogValuesFormatter::format(const std::vector<Value>& values) const {
    // Too short to hold a placeholder: plain literal text
    if (original_format_.size() < kMinScannedLength) {
        return Result<std::string>::ok(original_format_);
    }

    auto rendered = format_composite(canonical_format(), prepare(values));
    if (rendered.is_err()) {
        log::debug("cannot render \"%s\": %s",
                   original_format_.c_str(), rendered.error().message.c_str());
    }
    return rendered;
}

Result<std::string> LogValuesFormatter::format() const {
    return format(std::vector<Value>{});
}

Result<NamedValue> LogValuesFormatter::get_value(const std::vector<Value>& values,
                                                 int index) const {
    const auto& names = value_names();
    if (index < 0 || static_cast<size_t>(index) > names.size()) {
        return TemplateError{TemplateError::OutOfRange,
            "index " + std::to_string(index) + " is out of range",
            "valid indices are 0 to " + std::to_string(names.size())};
    }

    size_t i = static_cast<size_t>(index);
    if (i == names.size()) {
        return Result<NamedValue>::ok(original_format_pair());
    }
    if (i >= values.size()) {
        return TemplateError{TemplateError::OutOfRange,
            "no value supplied for '" + names[i] + "' at index " + std::to_string(i),
            std::to_string(values.size()) + " value(s) supplied"};
    }
    return Result<NamedValue>::ok(NamedValue{names[i], values[i]});
}

Result<std::vector<NamedValue>> LogValuesFormatter::get_values(
        const std::vector<Value>& values) const {
    const auto& names = value_names();
    if (names.size() > values.size()) {
        return TemplateError{TemplateError::OutOfRange,
            "template has " + std::to_string(names.size()) + " placeholder(s) but " +
            std::to_string(values.size()) + " value(s) were supplied"};
    }

    size_t slots = options_.values_layout == ValuesLayout::Compat
        ? values.size() + 1
        : names.size() + 1;

    std::vector<NamedValue> pairs(slots);
    for (size_t i = 0; i < names.size(); ++i) {
        pairs[i] = NamedValue{names[i], values[i]};
    }
    pairs.back() = original_format_pair();
    return Result<std::vector<NamedValue>>::ok(std::move(pairs));
}

} // namespace logtmpl
