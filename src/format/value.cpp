#include <logtmpl/value.hpp>
#include <fmt/format.h>
#include <cmath>

namespace logtmpl {

std::string double_to_string(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-Infinity" : "Infinity";
    std::string s = fmt::format("{}", d);
    size_t e = s.find('e');
    if (e != std::string::npos) s[e] = 'E';
    return s;
}

static std::string element_to_string(const Value& v,
                                     std::string_view separator,
                                     std::string_view null_marker) {
    if (v.is_null()) return std::string(null_marker);
    if (v.is_list()) return join_list(v.as_list(), separator, null_marker);
    return v.to_string();
}

std::string join_list(const Value::List& items,
                      std::string_view separator,
                      std::string_view null_marker) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out.append(separator);
        out += element_to_string(items[i], separator, null_marker);
    }
    return out;
}

std::string Value::to_string() const {
    switch (kind()) {
        case Kind::Null:   return "";
        case Kind::Bool:   return as_bool() ? "True" : "False";
        case Kind::Int:    return std::to_string(as_int());
        case Kind::UInt:   return std::to_string(as_uint());
        case Kind::Double: return double_to_string(as_double());
        case Kind::Text:   return as_text();
        case Kind::List:   return join_list(as_list(), ", ", "(null)");
    }
    return "";
}

bool operator==(const Value& a, const Value& b) {
    return a.data_ == b.data_;
}

} // namespace logtmpl
