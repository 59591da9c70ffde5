#include <logtmpl/numeric_pattern.hpp>
#include <fmt/format.h>
#include <cmath>
#include <cstdlib>
#include <vector>

namespace logtmpl {

namespace {

// Significant digits kept from a double before custom formatting.
constexpr int kDoubleDigits = 15;

// |value| = 0.digits x 10^exponent; empty digits means zero.
struct Decimal {
    std::string digits;
    int exponent = 0;
    bool negative = false;

    bool is_zero() const { return digits.find_first_not_of('0') == std::string::npos; }
};

Decimal to_decimal(const Value& v) {
    Decimal dec;
    if (v.kind() == Value::Kind::Int || v.kind() == Value::Kind::UInt) {
        uint64_t magnitude;
        if (v.kind() == Value::Kind::Int) {
            int64_t i = v.as_int();
            dec.negative = i < 0;
            magnitude = dec.negative ? ~static_cast<uint64_t>(i) + 1 : static_cast<uint64_t>(i);
        } else {
            magnitude = v.as_uint();
        }
        if (magnitude != 0) {
            dec.digits = std::to_string(magnitude);
            dec.exponent = static_cast<int>(dec.digits.size());
        }
    } else {
        double d = v.as_double();
        dec.negative = std::signbit(d) && d != 0.0;
        if (d != 0.0) {
            // "d.dddddddddddddde+XX"
            std::string s = fmt::format("{:.{}e}", std::fabs(d), kDoubleDigits - 1);
            size_t e = s.find('e');
            dec.digits = s.substr(0, 1) + s.substr(2, e - 2);
            dec.exponent = std::atoi(s.c_str() + e + 1) + 1;
        }
    }

    size_t last = dec.digits.find_last_not_of('0');
    dec.digits.erase(last == std::string::npos ? 0 : last + 1);
    return dec;
}

// Round to `frac` fractional digits, half away from zero.
void round_decimal(Decimal& dec, int frac) {
    int keep = dec.exponent + frac;
    if (keep < 0) {
        dec.digits.clear();
        return;
    }
    if (static_cast<size_t>(keep) >= dec.digits.size()) return;

    bool up = dec.digits[static_cast<size_t>(keep)] >= '5';
    dec.digits.erase(static_cast<size_t>(keep));
    if (!up) return;

    int i = keep - 1;
    while (i >= 0 && dec.digits[static_cast<size_t>(i)] == '9') {
        dec.digits[static_cast<size_t>(i)] = '0';
        --i;
    }
    if (i >= 0) {
        ++dec.digits[static_cast<size_t>(i)];
    } else {
        dec.digits.insert(dec.digits.begin(), '1');
        ++dec.exponent;
    }
}

std::string integer_digits(const Decimal& dec) {
    std::string out;
    for (int i = 0; i < dec.exponent; ++i) {
        out += static_cast<size_t>(i) < dec.digits.size() ? dec.digits[static_cast<size_t>(i)] : '0';
    }
    size_t nz = out.find_first_not_of('0');
    out.erase(0, nz == std::string::npos ? out.size() : nz);
    return out;
}

std::string fraction_digits(const Decimal& dec, int frac) {
    std::string out;
    for (int i = 0; i < frac; ++i) {
        int pos = dec.exponent + i;
        bool have = pos >= 0 && static_cast<size_t>(pos) < dec.digits.size();
        out += have ? dec.digits[static_cast<size_t>(pos)] : '0';
    }
    return out;
}

enum class TokenKind { Zero, Hash, Point, Comma, Percent, Exponent, Literal };

struct Token {
    TokenKind kind;
    std::string text;         // Literal
    bool exp_plus = false;    // Exponent: always write the sign
    bool exp_upper = true;
    int exp_digits = 1;
};

std::vector<std::string_view> split_sections(std::string_view pattern) {
    std::vector<std::string_view> sections;
    size_t start = 0;
    char quote = 0;
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (quote) {
            if (c == quote) quote = 0;
        } else if (c == '\\') {
            ++i;
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == ';' && sections.size() < 2) {
            sections.push_back(pattern.substr(start, i - start));
            start = i + 1;
        }
    }
    sections.push_back(pattern.substr(start));
    return sections;
}

std::vector<Token> tokenize(std::string_view section) {
    std::vector<Token> tokens;
    auto literal = [&tokens](std::string_view text) {
        if (!tokens.empty() && tokens.back().kind == TokenKind::Literal) {
            tokens.back().text.append(text);
        } else {
            tokens.push_back(Token{TokenKind::Literal, std::string(text)});
        }
    };

    for (size_t i = 0; i < section.size(); ++i) {
        char c = section[i];
        switch (c) {
            case '0': tokens.push_back(Token{TokenKind::Zero, {}}); break;
            case '#': tokens.push_back(Token{TokenKind::Hash, {}}); break;
            case '.': tokens.push_back(Token{TokenKind::Point, {}}); break;
            case ',': tokens.push_back(Token{TokenKind::Comma, {}}); break;
            case '%': tokens.push_back(Token{TokenKind::Percent, {}}); break;
            case '\\':
                if (i + 1 < section.size()) literal(section.substr(++i, 1));
                break;
            case '\'':
            case '"': {
                size_t end = section.find(c, i + 1);
                if (end == std::string_view::npos) end = section.size();
                literal(section.substr(i + 1, end - i - 1));
                i = end;
                break;
            }
            case 'E':
            case 'e': {
                size_t j = i + 1;
                bool plus = false;
                if (j < section.size() && (section[j] == '+' || section[j] == '-')) {
                    plus = section[j] == '+';
                    ++j;
                }
                size_t zeros = j;
                while (zeros < section.size() && section[zeros] == '0') ++zeros;
                if (zeros == j) {
                    literal(section.substr(i, 1));
                    break;
                }
                Token t{TokenKind::Exponent, {}};
                t.exp_plus = plus;
                t.exp_upper = c == 'E';
                t.exp_digits = static_cast<int>(zeros - j);
                tokens.push_back(std::move(t));
                i = zeros - 1;
                break;
            }
            default:
                literal(section.substr(i, 1));
        }
    }
    return tokens;
}

bool is_placeholder(const Token& t) {
    return t.kind == TokenKind::Zero || t.kind == TokenKind::Hash;
}

// Placeholder counts and modifiers of one section.
struct Layout {
    int int_places = 0;
    int min_int = 0;
    int max_frac = 0;
    int min_frac = 0;
    int scale = 0;        // power of ten applied to the value
    bool grouping = false;
    const Token* exponent = nullptr;
};

Layout analyze(const std::vector<Token>& tokens) {
    Layout lay;
    bool after_point = false;
    bool seen_zero = false;
    int pending_commas = 0;

    for (const auto& t : tokens) {
        if (lay.exponent) break;
        switch (t.kind) {
            case TokenKind::Zero:
            case TokenKind::Hash:
                if (after_point) {
                    ++lay.max_frac;
                    if (t.kind == TokenKind::Zero) lay.min_frac = lay.max_frac;
                } else {
                    if (pending_commas > 0 && lay.int_places > 0) lay.grouping = true;
                    pending_commas = 0;
                    ++lay.int_places;
                    if (t.kind == TokenKind::Zero) seen_zero = true;
                    if (seen_zero) ++lay.min_int;
                }
                break;
            case TokenKind::Point:
                after_point = true;
                break;
            case TokenKind::Comma:
                if (!after_point) ++pending_commas;
                break;
            case TokenKind::Percent:
                lay.scale += 2;
                break;
            case TokenKind::Exponent:
                lay.exponent = &t;
                break;
            case TokenKind::Literal:
                break;
        }
    }
    // Commas right before the point (or the end) divide by 1000 each
    if (lay.int_places > 0) lay.scale -= 3 * pending_commas;
    return lay;
}

std::string group_digits(const std::string& digits) {
    std::string out;
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return out;
}

std::string render_section(const std::vector<Token>& tokens, Decimal dec, bool with_sign) {
    Layout lay = analyze(tokens);
    if (lay.int_places == 0 && lay.max_frac == 0) {
        std::string out;
        for (const auto& t : tokens) {
            if (t.kind == TokenKind::Literal) out += t.text;
            else if (t.kind == TokenKind::Percent) out += '%';
        }
        return out;
    }

    dec.exponent += lay.scale;

    int sci = 0;
    if (lay.exponent) {
        int places = lay.int_places > 0 ? lay.int_places : 1;
        if (!dec.is_zero()) {
            sci = dec.exponent - places;
            dec.exponent = places;
            round_decimal(dec, lay.max_frac);
            if (dec.exponent > places) {
                dec.exponent = places;
                ++sci;
            }
        }
    } else {
        round_decimal(dec, lay.max_frac);
    }

    std::string int_str = integer_digits(dec);
    if (static_cast<int>(int_str.size()) < lay.min_int) {
        int_str.insert(0, static_cast<size_t>(lay.min_int) - int_str.size(), '0');
    }
    std::string frac_str = fraction_digits(dec, lay.max_frac);
    while (static_cast<int>(frac_str.size()) > lay.min_frac && frac_str.back() == '0') {
        frac_str.pop_back();
    }

    bool nonzero = (int_str + frac_str).find_first_not_of('0') != std::string::npos;
    std::string out = (with_sign && dec.negative && nonzero) ? "-" : "";

    if (lay.grouping) int_str = group_digits(int_str);
    // Digits that do not fit the placeholders all go to the first one
    int lead = lay.grouping ? static_cast<int>(int_str.size())
                            : static_cast<int>(int_str.size()) - lay.int_places;

    int int_seen = 0;
    int frac_seen = 0;
    bool after_point = false;
    for (const auto& t : tokens) {
        switch (t.kind) {
            case TokenKind::Zero:
            case TokenKind::Hash:
                if (lay.exponent && &t > lay.exponent) break;
                if (after_point) {
                    if (frac_seen < static_cast<int>(frac_str.size())) out += frac_str[frac_seen];
                    ++frac_seen;
                } else {
                    if (int_seen == 0 && lead > 0) out.append(int_str, 0, static_cast<size_t>(lead));
                    if (!lay.grouping) {
                        int pos = lead + int_seen;
                        if (pos >= 0) out += int_str[static_cast<size_t>(pos)];
                    }
                    ++int_seen;
                }
                break;
            case TokenKind::Point:
                if (after_point) break;
                after_point = true;
                if (lay.int_places == 0) out += int_str;
                if (!frac_str.empty()) out += '.';
                break;
            case TokenKind::Comma:
                break;
            case TokenKind::Percent:
                out += '%';
                break;
            case TokenKind::Exponent: {
                out += t.exp_upper ? 'E' : 'e';
                if (sci < 0) out += '-';
                else if (t.exp_plus) out += '+';
                std::string e = std::to_string(std::abs(sci));
                if (static_cast<int>(e.size()) < t.exp_digits) {
                    e.insert(0, static_cast<size_t>(t.exp_digits) - e.size(), '0');
                }
                out += e;
                break;
            }
            case TokenKind::Literal:
                out += t.text;
                break;
        }
    }
    return out;
}

} // namespace

std::string format_numeric_pattern(const Value& value, std::string_view pattern) {
    Decimal dec = to_decimal(value);
    std::vector<std::string_view> sections = split_sections(pattern);

    std::string_view section = sections[0];
    bool with_sign = true;
    if (dec.negative && sections.size() >= 2 && !sections[1].empty()) {
        section = sections[1];
        with_sign = false;
    } else if (dec.is_zero() && sections.size() == 3 && !sections[2].empty()) {
        section = sections[2];
    }

    return render_section(tokenize(section), std::move(dec), with_sign);
}

} // namespace logtmpl
