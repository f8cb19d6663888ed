#include "cellexpr/sheet.hpp"

#include <charconv>
#include <cmath>

namespace cellexpr {

CellAddress Sheet::address_of(std::string_view label) {
    auto address = parse_cell_label(label);
    if (!address) throw SheetError("Invalid cell label: '" + std::string(label) + "'");
    return *address;
}

Cell& Sheet::cell_by_label(std::string_view label) {
    return cells_[address_of(label)];
}

const Cell& Sheet::cell_by_label(std::string_view label) const {
    static const Cell blank;
    auto it = cells_.find(address_of(label));
    return it == cells_.end() ? blank : it->second;
}

bool Sheet::contains(std::string_view label) const {
    auto address = parse_cell_label(label);
    return address && cells_.count(*address) != 0;
}

void Sheet::set_formula(std::string_view label, Formula formula) {
    Cell& cell = cell_by_label(label);
    cell.set_formula(std::move(formula));
    cell.set_error({});
    cell.set_value(0.0);
}

void Sheet::set_value(std::string_view label, double value) {
    if (!std::isfinite(value)) throw SheetError("Non-finite value for " + std::string(label));

    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) throw SheetError("Cannot format value for " + std::string(label));

    Cell& cell = cell_by_label(label);
    cell.set_formula(Formula{std::string(buf, end)});
    cell.set_error({});
    cell.set_value(value);
}

double Sheet::recompute(std::string_view label, Evaluator<Sheet>& evaluator) {
    Cell& cell = cell_by_label(label);
    double v = evaluator.evaluate(cell.formula());
    cell.set_value(v);
    cell.set_error(evaluator.error());
    return v;
}

} // namespace cellexpr
