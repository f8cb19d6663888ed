#include <gtest/gtest.h>
#include <cellexpr/sheet.hpp>

#include <cmath>
#include <limits>

namespace {

TEST(Sheet, BlankCellOnFirstLookup) {
    cellexpr::Sheet sheet;
    EXPECT_FALSE(sheet.contains("A1"));

    const cellexpr::Sheet& view = sheet;
    const auto& blank = view.cell_by_label("A1");
    EXPECT_TRUE(blank.formula().empty());
    EXPECT_EQ(blank.error(), "");
    EXPECT_DOUBLE_EQ(blank.value(), 0.0);
    EXPECT_EQ(sheet.cell_count(), 0u);

    sheet.cell_by_label("A1");
    EXPECT_TRUE(sheet.contains("A1"));
    EXPECT_EQ(sheet.cell_count(), 1u);
}

TEST(Sheet, InvalidLabelThrows) {
    cellexpr::Sheet sheet;
    EXPECT_THROW(sheet.cell_by_label("a1"), cellexpr::SheetError);
    EXPECT_THROW(sheet.set_formula("1A", {"1"}), cellexpr::SheetError);
    EXPECT_THROW(sheet.set_value("B2", std::numeric_limits<double>::infinity()), cellexpr::SheetError);
    EXPECT_FALSE(sheet.contains("nope"));
}

TEST(Sheet, SetValueStoresOneTokenFormula) {
    cellexpr::Sheet sheet;
    sheet.set_value("C4", -2.5);

    const auto& c4 = sheet.cell_by_label("C4");
    ASSERT_EQ(c4.formula().size(), 1u);
    EXPECT_DOUBLE_EQ(*cellexpr::parse_number(c4.formula()[0]), -2.5);
    EXPECT_DOUBLE_EQ(c4.value(), -2.5);
    EXPECT_EQ(c4.error(), "");
}

TEST(Sheet, RecomputeWritesBack) {
    cellexpr::Sheet sheet;
    cellexpr::Evaluator ev(sheet);

    sheet.set_value("A1", 3);
    sheet.set_formula("A2", {"A1", "*", "2"});
    sheet.set_formula("A3", {"A2", "+", "A1"});

    EXPECT_DOUBLE_EQ(sheet.recompute("A2", ev), 6.0);
    EXPECT_DOUBLE_EQ(sheet.recompute("A3", ev), 9.0);
    EXPECT_DOUBLE_EQ(sheet.cell_by_label("A3").value(), 9.0);
    EXPECT_EQ(sheet.cell_by_label("A3").error(), "");
}

TEST(Sheet, ErrorsTravelThroughCells) {
    cellexpr::Sheet sheet;
    cellexpr::Evaluator ev(sheet);

    sheet.set_formula("B1", {"1", "/", "0"});
    sheet.set_formula("B2", {"B1", "+", "1"});

    EXPECT_TRUE(std::isinf(sheet.recompute("B1", ev)));
    EXPECT_EQ(sheet.cell_by_label("B1").error(), "#DIV/0!");

    EXPECT_DOUBLE_EQ(sheet.recompute("B2", ev), 1.0);
    EXPECT_EQ(sheet.cell_by_label("B2").error(), "#DIV/0!");
}

TEST(Sheet, EmptyFormulaCellReadsAsInvalidCell) {
    cellexpr::Sheet sheet;
    cellexpr::Evaluator ev(sheet);

    sheet.set_formula("D1", {});
    EXPECT_DOUBLE_EQ(sheet.recompute("D1", ev), 0.0);
    EXPECT_EQ(sheet.cell_by_label("D1").error(), "#EMPTY!");

    sheet.set_formula("D2", {"D1", "+", "4"});
    EXPECT_DOUBLE_EQ(sheet.recompute("D2", ev), 4.0);
    EXPECT_EQ(sheet.cell_by_label("D2").error(), "#REF!");
}

TEST(Sheet, SetFormulaClearsPreviousOutcome) {
    cellexpr::Sheet sheet;
    cellexpr::Evaluator ev(sheet);

    sheet.set_formula("E1", {"(", "2"});
    sheet.recompute("E1", ev);
    ASSERT_EQ(sheet.cell_by_label("E1").error(), "#ERR");

    sheet.set_formula("E1", {"5"});
    EXPECT_EQ(sheet.cell_by_label("E1").error(), "");
    EXPECT_DOUBLE_EQ(sheet.cell_by_label("E1").value(), 0.0);
}

} // namespace
