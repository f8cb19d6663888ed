#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cellexpr {

// Tokens arrive already split; a formula is just their sequence.
using Token   = std::string;
using Formula = std::vector<Token>;

enum class TokKind {
    Number,
    CellRef,

    Plus, Minus, Star, Slash,
    LParen, RParen,

    Unknown,
};

/// Locale-independent decimal conversion. The whole token must be a number:
/// optional sign, digits with optional fraction, optional exponent.
std::optional<double> parse_number(std::string_view token);

bool is_number(std::string_view token);

/// Numbers are recognised before cell references.
TokKind classify(std::string_view token);

} // namespace cellexpr
