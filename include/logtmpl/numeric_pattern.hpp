#pragma once

#include <logtmpl/value.hpp>
#include <string>
#include <string_view>

namespace logtmpl {

// Custom numeric format patterns such as "0.00", "#,##0" or
// "0.00;(0.00);zero". Supported: '0' and '#' digit placeholders, '.',
// ',' grouping and x1000 scaling, '%', E+0 exponents, '\' escapes, quoted
// literals and up to three ';' sections. Any other character is literal.
// Doubles are rounded from 15 significant digits, half away from zero.
//
// `value` must be a finite number. Never fails: a pattern without digit
// placeholders renders as its literal text.
std::string format_numeric_pattern(const Value& value, std::string_view pattern);

} // namespace logtmpl
