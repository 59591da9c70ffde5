#include <logtmpl/composite_format.hpp>
#include <logtmpl/numeric_pattern.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <cstdlib>

namespace logtmpl {

namespace {

// Indices past this are clamped; no argument list is that long.
constexpr size_t kIndexLimit = 1000000;

struct NumericSpec {
    char type = 'G';
    int precision = -1;  // -1 means the type's default
};

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

size_t skip_spaces(std::string_view s, size_t pos) {
    while (pos < s.size() && s[pos] == ' ') ++pos;
    return pos;
}

TemplateError bad_spec(std::string_view spec) {
    return TemplateError{TemplateError::Format,
        "unsupported format string '" + std::string(spec) + "'",
        "use D, X, F, N, E, G or P with an optional precision, or a pattern such as 0.00"};
}

// A letter followed only by digits; anything else is a custom pattern.
bool is_standard_spec(std::string_view spec) {
    if (!std::isalpha(static_cast<unsigned char>(spec[0]))) return false;
    for (char c : spec.substr(1)) {
        if (!is_digit(c)) return false;
    }
    return true;
}

Result<NumericSpec> parse_numeric_spec(std::string_view spec) {
    NumericSpec ns;
    ns.type = spec[0];

    int precision = -1;
    for (char c : spec.substr(1)) {
        precision = (precision < 0 ? 0 : precision * 10) + (c - '0');
        if (precision > kMaxPrecision) return bad_spec(spec);
    }
    ns.precision = precision;
    return Result<NumericSpec>::ok(ns);
}

std::string zero_pad(std::string digits, int precision) {
    if (precision > 0 && digits.size() < static_cast<size_t>(precision)) {
        digits.insert(0, static_cast<size_t>(precision) - digits.size(), '0');
    }
    return digits;
}

// Insert ',' group separators into the integer part of a plain decimal.
std::string group_thousands(const std::string& number) {
    size_t begin = (!number.empty() && number[0] == '-') ? 1 : 0;
    size_t end = number.find('.');
    if (end == std::string::npos) end = number.size();

    std::string out = number.substr(0, begin);
    size_t len = end - begin;
    for (size_t i = 0; i < len; ++i) {
        if (i > 0 && (len - i) % 3 == 0) out += ',';
        out += number[begin + i];
    }
    out += number.substr(end);
    return out;
}

// fmt writes at least two exponent digits; the invariant convention uses three.
std::string widen_exponent(std::string s, bool upper) {
    size_t e = s.find_first_of("eE");
    if (e == std::string::npos) return s;
    s[e] = upper ? 'E' : 'e';

    size_t digits = e + 2;  // skip the sign
    size_t count = s.size() - digits;
    if (count < 3) s.insert(digits, 3 - count, '0');
    return s;
}

// Exponent marker in the case of the format letter.
std::string exponent_case(std::string s, bool upper) {
    for (char& c : s) {
        if (c == 'e' || c == 'E') c = upper ? 'E' : 'e';
    }
    return s;
}

// Integer kinds are formatted exactly from sign and magnitude.
struct IntegerParts {
    bool negative = false;
    uint64_t magnitude = 0;
    uint64_t bits = 0;  // two's complement image for hex output
};

IntegerParts integer_parts(const Value& v) {
    IntegerParts p;
    if (v.kind() == Value::Kind::Int) {
        int64_t i = v.as_int();
        p.negative = i < 0;
        p.bits = static_cast<uint64_t>(i);
        p.magnitude = p.negative ? ~p.bits + 1 : p.bits;
    } else {
        p.magnitude = p.bits = v.as_uint();
    }
    return p;
}

double as_double(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Int:  return static_cast<double>(v.as_int());
        case Value::Kind::UInt: return static_cast<double>(v.as_uint());
        default:                return v.as_double();
    }
}

std::string fixed(const Value& v, int precision, bool grouped) {
    std::string s;
    if (v.is_integer()) {
        IntegerParts p = integer_parts(v);
        s = (p.negative ? "-" : "") + std::to_string(p.magnitude);
        if (precision > 0) {
            s += '.';
            s.append(static_cast<size_t>(precision), '0');
        }
    } else {
        s = fmt::format("{:.{}f}", v.as_double(), precision);
    }
    return grouped ? group_thousands(s) : s;
}

} // namespace

Result<FormatItem> parse_format_item(std::string_view body) {
    FormatItem item;
    size_t pos = skip_spaces(body, 0);

    if (pos >= body.size() || !is_digit(body[pos])) {
        return TemplateError{TemplateError::Format,
            "format item '{" + std::string(body) + "}' does not start with an index"};
    }
    while (pos < body.size() && is_digit(body[pos])) {
        if (item.index < kIndexLimit) {
            item.index = item.index * 10 + static_cast<size_t>(body[pos] - '0');
        }
        ++pos;
    }
    pos = skip_spaces(body, pos);

    if (pos < body.size() && body[pos] == ',') {
        pos = skip_spaces(body, pos + 1);
        bool left = pos < body.size() && body[pos] == '-';
        if (left) ++pos;
        if (pos >= body.size() || !is_digit(body[pos])) {
            return TemplateError{TemplateError::Format,
                "invalid alignment in format item '{" + std::string(body) + "}'"};
        }
        long width = 0;
        while (pos < body.size() && is_digit(body[pos])) {
            width = width * 10 + (body[pos] - '0');
            if (width > kMaxAlignment) {
                return TemplateError{TemplateError::Format,
                    "alignment exceeds " + std::to_string(kMaxAlignment) +
                    " in format item '{" + std::string(body) + "}'"};
            }
            ++pos;
        }
        item.alignment = static_cast<int>(left ? -width : width);
        pos = skip_spaces(body, pos);
    }

    if (pos < body.size()) {
        if (body[pos] != ':') {
            return TemplateError{TemplateError::Format,
                "unexpected '" + std::string(1, body[pos]) +
                "' in format item '{" + std::string(body) + "}'"};
        }
        item.spec = body.substr(pos + 1);
    }

    return Result<FormatItem>::ok(item);
}

Result<std::string> format_value(const Value& value, std::string_view spec) {
    if (spec.empty() || !value.is_number()) {
        return Result<std::string>::ok(value.to_string());
    }
    if (value.kind() == Value::Kind::Double && !std::isfinite(value.as_double())) {
        return Result<std::string>::ok(double_to_string(value.as_double()));
    }

    if (!is_standard_spec(spec)) {
        return Result<std::string>::ok(format_numeric_pattern(value, spec));
    }

    auto parsed = parse_numeric_spec(spec);
    LOGTMPL_TRY(parsed);
    NumericSpec ns = parsed.value();

    bool upper = std::isupper(static_cast<unsigned char>(ns.type)) != 0;
    switch (std::toupper(static_cast<unsigned char>(ns.type))) {
        case 'D': {
            if (!value.is_integer()) return bad_spec(spec);
            IntegerParts p = integer_parts(value);
            std::string digits = zero_pad(std::to_string(p.magnitude), ns.precision);
            return Result<std::string>::ok(p.negative ? "-" + digits : digits);
        }
        case 'X': {
            if (!value.is_integer()) return bad_spec(spec);
            IntegerParts p = integer_parts(value);
            std::string hex = upper ? fmt::format("{:X}", p.bits) : fmt::format("{:x}", p.bits);
            return Result<std::string>::ok(zero_pad(std::move(hex), ns.precision));
        }
        case 'F':
            return Result<std::string>::ok(fixed(value, ns.precision < 0 ? 2 : ns.precision, false));
        case 'N':
            return Result<std::string>::ok(fixed(value, ns.precision < 0 ? 2 : ns.precision, true));
        case 'E': {
            int precision = ns.precision < 0 ? 6 : ns.precision;
            std::string s = fmt::format("{:.{}e}", as_double(value), precision);
            return Result<std::string>::ok(widen_exponent(std::move(s), upper));
        }
        case 'G': {
            if (ns.precision <= 0) {
                std::string s = value.is_integer() ? value.to_string()
                                                   : double_to_string(value.as_double());
                return Result<std::string>::ok(exponent_case(std::move(s), upper));
            }
            std::string s = fmt::format("{:.{}g}", as_double(value), ns.precision);
            return Result<std::string>::ok(exponent_case(std::move(s), upper));
        }
        case 'P': {
            int precision = ns.precision < 0 ? 2 : ns.precision;
            std::string s = fmt::format("{:.{}f}", as_double(value) * 100.0, precision);
            return Result<std::string>::ok(group_thousands(s) + " %");
        }
        default:
            return bad_spec(spec);
    }
}

std::string align_text(std::string text, int alignment) {
    size_t width = static_cast<size_t>(std::abs(alignment));
    if (text.size() >= width) return text;

    size_t pad = width - text.size();
    if (alignment > 0) {
        text.insert(0, pad, ' ');
    } else {
        text.append(pad, ' ');
    }
    return text;
}

Result<std::string> format_composite(std::string_view format,
                                     const std::vector<Value>& args) {
    std::string out;
    out.reserve(format.size() + 16 * args.size());

    size_t i = 0;
    const size_t n = format.size();
    while (i < n) {
        char c = format[i];

        if (c == '}') {
            // "}}" is an escaped brace; a lone '}' is kept as is
            out += '}';
            i += (i + 1 < n && format[i + 1] == '}') ? 2 : 1;
            continue;
        }
        if (c != '{') {
            out += c;
            ++i;
            continue;
        }
        if (i + 1 < n && format[i + 1] == '{') {
            out += '{';
            i += 2;
            continue;
        }

        size_t close = format.find('}', i + 1);
        size_t first = skip_spaces(format, i + 1);
        if (close == std::string_view::npos || first >= close || !is_digit(format[first])) {
            // Not a format item
            out += '{';
            ++i;
            continue;
        }

        auto item = parse_format_item(format.substr(i + 1, close - i - 1));
        LOGTMPL_TRY(item);
        const FormatItem& fi = item.value();

        if (fi.index >= args.size()) {
            return TemplateError{TemplateError::OutOfRange,
                "format item {" + std::to_string(fi.index) + "} has no matching argument (" +
                std::to_string(args.size()) + " supplied)",
                "index must be greater than or equal to zero and less than the argument count"};
        }

        auto text = format_value(args[fi.index], fi.spec);
        LOGTMPL_TRY(text);
        out += align_text(std::move(text).value(), fi.alignment);

        i = close + 1;
    }

    return Result<std::string>::ok(std::move(out));
}

} // namespace logtmpl
