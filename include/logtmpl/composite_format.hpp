#pragma once

#include <logtmpl/result.hpp>
#include <logtmpl/value.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace logtmpl {

// One positional format item: {index[,alignment][:spec]}
struct FormatItem {
    size_t index = 0;
    int alignment = 0;      // > 0 right-aligns, < 0 left-aligns
    std::string_view spec;  // empty when absent
};

// Largest accepted alignment width and numeric precision.
inline constexpr int kMaxAlignment = 1000000;
inline constexpr int kMaxPrecision = 999;

// Parse the text between the braces of a format item.
Result<FormatItem> parse_format_item(std::string_view body);

// Apply a standard numeric format string (D, X, F, N, E, G, P with an
// optional precision) to a numeric value. Non-numeric values ignore `spec`.
Result<std::string> format_value(const Value& value, std::string_view spec);

// Pad `text` with spaces to |alignment| characters.
std::string align_text(std::string text, int alignment);

// Render a positional template against `args` with the invariant
// convention. "{{" and "}}" are literal braces; stray braces are copied
// through. A format item whose index has no argument is an OutOfRange error.
Result<std::string> format_composite(std::string_view format,
                                     const std::vector<Value>& args);

} // namespace logtmpl
