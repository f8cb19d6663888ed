#include "cellexpr/token.hpp"
#include "cellexpr/cell_address.hpp"
#include <cctype>
#include <charconv>
#include <limits>

namespace cellexpr {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

// from_chars also takes "inf", "nan" and hex floats; only plain decimals pass here.
static bool looks_decimal(std::string_view s) {
    std::size_t i = 0;
    bool digits = false;
    while (i < s.size() && is_digit(s[i])) { ++i; digits = true; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && is_digit(s[i])) { ++i; digits = true; }
    }
    if (!digits) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        if (i >= s.size() || !is_digit(s[i])) return false;
        while (i < s.size() && is_digit(s[i])) ++i;
    }
    return i == s.size();
}

// Decimal exponent of the leading significant digit, saturated. Only called on
// digits from_chars found out of range, so the sign tells overflow from underflow.
static long long magnitude(std::string_view s) {
    std::size_t i = 0;
    long long lead = 0;
    bool seen = false;
    while (i < s.size() && is_digit(s[i])) {
        if (seen || s[i] != '0') { seen = true; ++lead; }
        ++i;
    }
    long long m = lead - 1;
    if (i < s.size() && s[i] == '.') {
        ++i;
        long long zeros = 0;
        while (!seen && i < s.size() && s[i] == '0') { ++zeros; ++i; }
        if (!seen) m = -zeros - 1;
        while (i < s.size() && is_digit(s[i])) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        bool neg = false;
        if (s[i] == '+' || s[i] == '-') neg = s[i++] == '-';
        long long e = 0;
        for (; i < s.size(); ++i) {
            if (e < 1000000000LL) e = e * 10 + (s[i] - '0');
        }
        m += neg ? -e : e;
    }
    return m;
}

std::optional<double> parse_number(std::string_view token) {
    bool negative = false;
    if (!token.empty() && (token.front() == '+' || token.front() == '-')) {
        negative = token.front() == '-';
        token.remove_prefix(1);
    }
    if (!looks_decimal(token)) return std::nullopt;

    double v = 0.0;
    const char* begin = token.data();
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(begin, end, v, std::chars_format::general);
    if (ec == std::errc::result_out_of_range) {
        v = magnitude(token) > 0 ? std::numeric_limits<double>::infinity() : 0.0;
    } else if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return negative ? -v : v;
}

bool is_number(std::string_view token) {
    return parse_number(token).has_value();
}

TokKind classify(std::string_view token) {
    if (is_number(token)) return TokKind::Number;
    if (is_valid_cell_label(token)) return TokKind::CellRef;

    if (token.size() == 1) {
        switch (token.front()) {
            case '+': return TokKind::Plus;
            case '-': return TokKind::Minus;
            case '*': return TokKind::Star;
            case '/': return TokKind::Slash;
            case '(': return TokKind::LParen;
            case ')': return TokKind::RParen;
            default: break;
        }
    }
    return TokKind::Unknown;
}

} // namespace cellexpr
