#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace logtmpl {

// Templates shorter than this are returned verbatim with no placeholders.
inline constexpr size_t kMinScannedLength = 3;

// Which brace of an unescaped (odd-length) run marks the boundary.
enum class RunPick { First, Last };

struct BracePolicy {
    char brace;
    RunPick pick;
};

// "{{{X}}}" is literal '{', placeholder X, literal '}': an opener is the
// last brace of its run, a closer the first brace of its run.
inline constexpr BracePolicy kOpenBracePolicy{'{', RunPick::Last};
inline constexpr BracePolicy kCloseBracePolicy{'}', RunPick::First};

// Characters that end a placeholder name: alignment and format string.
inline constexpr std::string_view kFormatDelimiters = ",:";

// Result of rewriting named placeholders into positional ones.
// Slot i of `canonical` corresponds to names[i].
struct ParsedTemplate {
    std::string canonical;
    std::vector<std::string> names;
};

// Find the boundary brace described by `policy` in text[start, end).
// Even-length runs are escaped literals and are skipped. Returns `end` when
// no unescaped brace exists.
size_t find_brace(std::string_view text, const BracePolicy& policy,
                  size_t start, size_t end);

// Rewrite every {Name[,align][:spec]} into {index[,align][:spec]}.
// Never fails: unterminated or stray braces are kept as literal text.
ParsedTemplate parse_template(std::string_view raw);

} // namespace logtmpl
