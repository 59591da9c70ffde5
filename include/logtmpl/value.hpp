#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace logtmpl {

// A single argument supplied to a message template: null, a scalar, text,
// or a list of values. Text is never treated as a list.
class Value {
public:
    enum class Kind { Null, Bool, Int, UInt, Double, Text, List };
    using List = std::vector<Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data_(b) {}
    Value(char c) : data_(std::string(1, c)) {}
    template<typename T,
             std::enable_if_t<std::is_integral_v<T> &&
                              !std::is_same_v<T, bool> &&
                              !std::is_same_v<T, char>, int> = 0>
    Value(T v) {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<int64_t>(v);
        } else {
            data_ = static_cast<uint64_t>(v);
        }
    }
    Value(double d) : data_(d) {}
    Value(float f) : data_(static_cast<double>(f)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(std::string_view s) : data_(std::string(s)) {}
    Value(List items) : data_(std::move(items)) {}

    static Value null() { return Value(); }
    static Value list(std::initializer_list<Value> items) { return Value(List(items)); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_null() const { return kind() == Kind::Null; }
    bool is_text() const { return kind() == Kind::Text; }
    bool is_list() const { return kind() == Kind::List; }
    bool is_integer() const { return kind() == Kind::Int || kind() == Kind::UInt; }
    bool is_number() const { return is_integer() || kind() == Kind::Double; }

    // Typed accessors throw std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    uint64_t as_uint() const { return std::get<uint64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_text() const { return std::get<std::string>(data_); }
    const List& as_list() const { return std::get<List>(data_); }

    // Invariant display form. Null renders as the empty string; lists are
    // joined with ", " and null elements shown as "(null)".
    std::string to_string() const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    // Alternative order must match Kind.
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, List> data_;
};

// Join the display form of each element with `separator`, substituting
// `null_marker` for null elements. Nested lists are joined the same way.
std::string join_list(const Value::List& items,
                      std::string_view separator,
                      std::string_view null_marker);

// Invariant display form of a double: shortest round-trip decimal with an
// upper-case exponent ("1E+20"), "NaN", "Infinity" or "-Infinity".
std::string double_to_string(double d);

} // namespace logtmpl
