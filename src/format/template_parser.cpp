#include <logtmpl/template_parser.hpp>
#include <logtmpl/log.hpp>

namespace logtmpl {

size_t find_brace(std::string_view text, const BracePolicy& policy,
                  size_t start, size_t end) {
    // Example: {{prefix{{{Argument}}}suffix}}
    size_t brace_index = end;
    size_t run = 0;

    for (size_t i = start; i < end; ++i) {
        if (run > 0 && text[i] != policy.brace) {
            if (run % 2 == 0) {
                // Escaped pair(s); keep looking past them
                run = 0;
                brace_index = end;
            } else {
                break;
            }
        } else if (text[i] == policy.brace) {
            if (policy.pick == RunPick::Last || run == 0) {
                brace_index = i;
            }
            ++run;
        }
    }

    return brace_index;
}

static size_t find_delimiter(std::string_view text, size_t start, size_t end) {
    size_t pos = text.substr(0, end).find_first_of(kFormatDelimiters, start);
    return pos == std::string_view::npos ? end : pos;
}

ParsedTemplate parse_template(std::string_view raw) {
    ParsedTemplate parsed;

    if (raw.size() < kMinScannedLength) {
        parsed.canonical = std::string(raw);
        return parsed;
    }

    parsed.canonical.reserve(raw.size());
    const size_t end = raw.size();
    size_t scan = 0;

    while (scan < end) {
        size_t open = find_brace(raw, kOpenBracePolicy, scan, end);
        size_t close = find_brace(raw, kCloseBracePolicy, open, end);

        if (close == end) {
            parsed.canonical.append(raw.substr(scan));
            break;
        }

        // Everything through the opener, then the slot index in place of the name
        parsed.canonical.append(raw.substr(scan, open - scan + 1));
        parsed.canonical += std::to_string(parsed.names.size());

        size_t delim = find_delimiter(raw, open, close);
        parsed.names.emplace_back(raw.substr(open + 1, delim - open - 1));
        parsed.canonical.append(raw.substr(delim, close - delim + 1));

        scan = close + 1;
    }

    log::trace("parsed template \"%.*s\": %zu placeholder(s)",
               static_cast<int>(raw.size()), raw.data(), parsed.names.size());
    return parsed;
}

} // namespace logtmpl
