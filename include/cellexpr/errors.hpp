#pragma once
#include <string>
#include <string_view>

namespace cellexpr {

enum class ErrorKind {
    None,
    EmptyFormula,
    InvalidFormula,
    InvalidCell,
    DivideByZero,
};

/// Text latched into Evaluator::error() for each kind. Replace the defaults to
/// localize; every message must stay distinct so kind_of() can map it back.
struct ErrorMessages {
    std::string empty_formula{"#EMPTY!"};
    std::string invalid_formula{"#ERR"};
    std::string invalid_cell{"#REF!"};
    std::string divide_by_zero{"#DIV/0!"};

    const std::string& message(ErrorKind kind) const;

    /// Empty text is None. Text outside the catalog is an error a referenced
    /// cell picked up elsewhere and counts as InvalidCell.
    ErrorKind kind_of(std::string_view text) const;
};

const char* to_string(ErrorKind kind);

} // namespace cellexpr
