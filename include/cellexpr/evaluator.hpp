#pragma once
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cellexpr/errors.hpp"
#include "cellexpr/token.hpp"

namespace cellexpr {

struct Fault {
    ErrorKind kind{ErrorKind::None};
    std::string message{};
};

/// Outcome of one grammar production.
struct Step {
    double value{0.0};
    std::optional<Fault> fault{}; // most recent fault seen inside the production
    bool flagged{false};          // a fault raised the error flag (an unmatched ')' does not)
    bool aborted{false};          // divide by zero: unwind with Infinity

    // Later faults overwrite earlier ones.
    void absorb(Step&& inner) {
        if (inner.fault) fault = std::move(inner.fault);
        flagged = flagged || inner.flagged;
        aborted = inner.aborted;
    }
};

/// Recursive-descent evaluator for tokenized cell formulas:
///
///   expression := term ( ('+' | '-') term )*
///   term       := factor ( ('*' | '/') factor )*
///   factor     := NUMBER | CELL_REFERENCE | '(' expression ')'
///
/// Store must provide cell_by_label(std::string_view) returning a cell with
/// formula(), error() and value(). evaluate() never throws on bad input;
/// failures are latched in error() and reflected in last_result().
template <class Store>
class Evaluator {
public:
    explicit Evaluator(Store& store, ErrorMessages messages = {})
        : store_(store), messages_(std::move(messages)) {}

    double evaluate(const Formula& formula) {
        error_.clear();
        kind_ = ErrorKind::None;
        result_ = 0.0;
        last_result_ = 0.0;

        if (formula.empty()) {
            latch(ErrorKind::EmptyFormula, messages_.empty_formula);
            return 0.0;
        }

        Descent d{*this, formula};
        Step s = d.expression();

        if (s.aborted) {
            latch(s.fault->kind, s.fault->message);
            result_ = last_result_ = std::numeric_limits<double>::infinity();
            return result_;
        }

        if (s.fault) latch(s.fault->kind, s.fault->message);

        if (d.pos != formula.size() && !s.flagged) {
            latch(ErrorKind::InvalidFormula, messages_.invalid_formula);
            last_result_ = std::numeric_limits<double>::quiet_NaN();
            return 0.0;
        }

        result_ = s.value;
        last_result_ = s.fault ? std::numeric_limits<double>::quiet_NaN() : s.value;
        return result_;
    }

    const std::string& error() const noexcept { return error_; }
    ErrorKind error_kind() const noexcept { return kind_; }
    double result() const noexcept { return result_; }
    double last_result() const noexcept { return last_result_; }

    const ErrorMessages& messages() const noexcept { return messages_; }

    /// Value of a referenced cell as (value, error). A cell's own empty-formula
    /// error is not propagated; an empty formula is reported as invalid_cell.
    std::pair<double, std::string> cell_value(std::string_view label) const {
        const auto& cell = store_.cell_by_label(label);
        const auto& error = cell.error();

        if (!error.empty() && error != messages_.empty_formula) return {0.0, error};
        if (cell.formula().empty()) return {0.0, messages_.invalid_cell};
        return {cell.value(), std::string{}};
    }

private:
    // Scratch state of a single evaluate() call.
    struct Descent {
        const Evaluator& ev;
        const Formula& tokens;
        std::size_t pos{0};

        TokKind peek() const {
            return pos < tokens.size() ? classify(tokens[pos]) : TokKind::Unknown;
        }

        Step fail(double value, ErrorKind kind, bool flagged) const {
            Step s;
            s.value = value;
            s.fault = Fault{kind, ev.messages_.message(kind)};
            s.flagged = flagged;
            return s;
        }

        // Advances only on a match; a mismatch is recorded in `into`.
        void expect(TokKind expected, Step& into) {
            if (peek() == expected) {
                ++pos;
                return;
            }
            into.absorb(fail(0.0, ErrorKind::InvalidFormula, false));
        }

        Step factor() {
            if (pos >= tokens.size()) return fail(0.0, ErrorKind::InvalidFormula, true);
            const std::string_view tok = tokens[pos];

            switch (classify(tok)) {
                case TokKind::Number: {
                    Step s;
                    s.value = *parse_number(tok);
                    ++pos;
                    return s;
                }

                case TokKind::CellRef: {
                    auto [value, error] = ev.cell_value(tok);
                    ++pos;
                    Step s;
                    s.value = value;
                    if (!error.empty()) {
                        ErrorKind kind = ev.messages_.kind_of(error);
                        s.fault = Fault{kind, std::move(error)};
                        s.flagged = true;
                    }
                    return s;
                }

                case TokKind::LParen: {
                    ++pos;
                    Step s = expression();
                    if (s.aborted) return s;
                    // a missing ')' is recorded but the inner value stands
                    expect(TokKind::RParen, s);
                    return s;
                }

                default:
                    return fail(0.0, ErrorKind::InvalidFormula, true);
            }
        }

        Step term() {
            Step acc = factor();
            if (acc.aborted) return acc;

            for (TokKind op = peek(); op == TokKind::Star || op == TokKind::Slash; op = peek()) {
                const bool divide = op == TokKind::Slash;
                ++pos;

                Step rhs = factor();
                if (rhs.aborted) {
                    acc.absorb(std::move(rhs));
                    acc.value = std::numeric_limits<double>::infinity();
                    return acc;
                }

                const double operand = rhs.value;
                acc.absorb(std::move(rhs));

                if (!divide) {
                    acc.value *= operand;
                } else if (operand == 0.0) {
                    Step dz = fail(std::numeric_limits<double>::infinity(), ErrorKind::DivideByZero, true);
                    dz.aborted = true;
                    acc.absorb(std::move(dz));
                    acc.value = std::numeric_limits<double>::infinity();
                    return acc;
                } else {
                    acc.value /= operand;
                }
            }
            return acc;
        }

        Step expression() {
            Step acc = term();
            if (acc.aborted) return acc;

            for (TokKind op = peek(); op == TokKind::Plus || op == TokKind::Minus; op = peek()) {
                const bool add = op == TokKind::Plus;
                ++pos;

                Step rhs = term();
                if (rhs.aborted) {
                    acc.absorb(std::move(rhs));
                    acc.value = std::numeric_limits<double>::infinity();
                    return acc;
                }

                const double operand = rhs.value;
                acc.absorb(std::move(rhs));
                acc.value = add ? acc.value + operand : acc.value - operand;
            }
            return acc;
        }
    };

    void latch(ErrorKind kind, const std::string& message) {
        kind_ = kind;
        error_ = message;
    }

    Store& store_;
    ErrorMessages messages_;

    std::string error_{};
    ErrorKind kind_{ErrorKind::None};
    double result_{0.0};
    double last_result_{0.0};
};

} // namespace cellexpr
