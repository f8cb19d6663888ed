#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "cellexpr/cell_address.hpp"
#include "cellexpr/evaluator.hpp"
#include "cellexpr/token.hpp"

namespace cellexpr {

struct SheetError : std::runtime_error { using std::runtime_error::runtime_error; };

class Cell {
public:
    const Formula& formula() const noexcept { return formula_; }
    const std::string& error() const noexcept { return error_; }
    double value() const noexcept { return value_; }

    void set_formula(Formula f) { formula_ = std::move(f); }
    void set_error(std::string e) { error_ = std::move(e); }
    void set_value(double v) { value_ = v; }

private:
    Formula formula_{};
    std::string error_{};
    double value_{0.0};
};

/// In-memory cell store keyed by address. Cells spring into existence blank
/// the first time they are looked up. Recalculation order is the caller's job.
class Sheet {
public:
    /// Throws SheetError if `label` is not a cell label.
    Cell& cell_by_label(std::string_view label);
    const Cell& cell_by_label(std::string_view label) const;

    bool contains(std::string_view label) const;
    std::size_t cell_count() const noexcept { return cells_.size(); }

    /// Replaces the formula and clears the cell's error and value.
    void set_formula(std::string_view label, Formula formula);

    /// Stores `value` as a one-token formula with that value already computed.
    void set_value(std::string_view label, double value);

    /// Evaluates the cell's formula and writes value and error back into it.
    /// Returns the value written.
    double recompute(std::string_view label, Evaluator<Sheet>& evaluator);

private:
    struct AddressLess {
        bool operator()(const CellAddress& a, const CellAddress& b) const noexcept {
            return a.row != b.row ? a.row < b.row : a.column < b.column;
        }
    };

    static CellAddress address_of(std::string_view label);

    std::map<CellAddress, Cell, AddressLess> cells_;
};

} // namespace cellexpr
