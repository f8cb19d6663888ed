#include "cellexpr/errors.hpp"

namespace cellexpr {

const std::string& ErrorMessages::message(ErrorKind kind) const {
    static const std::string none;
    switch (kind) {
        case ErrorKind::EmptyFormula:   return empty_formula;
        case ErrorKind::InvalidFormula: return invalid_formula;
        case ErrorKind::InvalidCell:    return invalid_cell;
        case ErrorKind::DivideByZero:   return divide_by_zero;
        case ErrorKind::None:           break;
    }
    return none;
}

ErrorKind ErrorMessages::kind_of(std::string_view text) const {
    if (text.empty())              return ErrorKind::None;
    if (text == empty_formula)     return ErrorKind::EmptyFormula;
    if (text == invalid_formula)   return ErrorKind::InvalidFormula;
    if (text == invalid_cell)      return ErrorKind::InvalidCell;
    if (text == divide_by_zero)    return ErrorKind::DivideByZero;
    return ErrorKind::InvalidCell;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:           return "none";
        case ErrorKind::EmptyFormula:   return "empty formula";
        case ErrorKind::InvalidFormula: return "invalid formula";
        case ErrorKind::InvalidCell:    return "invalid cell";
        case ErrorKind::DivideByZero:   return "divide by zero";
    }
    return "unknown";
}

} // namespace cellexpr
