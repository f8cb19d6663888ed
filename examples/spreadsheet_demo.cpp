#include <cellexpr/evaluator.hpp>
#include <cellexpr/sheet.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

struct Row {
    std::string label;
    cellexpr::Formula formula;
};

void print_formula(const cellexpr::Formula& f) {
    for (std::size_t i = 0; i < f.size(); ++i) {
        if (i) std::cout << ' ';
        std::cout << f[i];
    }
}

} // namespace

int main() {
    cellexpr::Sheet sheet;
    cellexpr::Evaluator evaluator(sheet);

    // Formulas are listed in dependency order; the sheet does no ordering itself.
    const std::vector<Row> rows = {
        {"A1", {"3"}},
        {"A2", {"4"}},
        {"A3", {"A1", "+", "A2", "*", "2"}},           // 11
        {"B1", {"(", "A1", "+", "A2", ")", "/", "2"}}, // 3.5
        {"B2", {"10", "-", "2", "-", "3"}},            // 5
        {"C1", {"A3", "/", "0"}},                       // #DIV/0!
        {"C2", {"C1", "+", "1"}},                       // C1's error carried over
        {"C3", {"Z9", "*", "2"}},                       // #REF!, Z9 is blank
        {"C4", {"(", "3", "+", "4"}},                   // #ERR, value kept
    };

    int failures = 0;
    try {
        for (const auto& r : rows) sheet.set_formula(r.label, r.formula);

        for (const auto& r : rows) {
            double v = sheet.recompute(r.label, evaluator);
            std::cout << r.label << " = ";
            print_formula(r.formula);
            std::cout << "  ->  " << v;
            if (!evaluator.error().empty()) {
                std::cout << "  [" << evaluator.error() << ", "
                          << cellexpr::to_string(evaluator.error_kind()) << "]";
                ++failures;
            }
            std::cout << "\n";
        }
    } catch (const cellexpr::SheetError& e) {
        std::cerr << "sheet error: " << e.what() << "\n";
        return 2;
    }

    std::cout << failures << " of " << rows.size() << " cells carry an error\n";
    return 0;
}
