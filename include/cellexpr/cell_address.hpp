#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace cellexpr {

/// Zero-based sheet coordinates. "A1" is {0, 0}.
struct CellAddress {
    int column{0};
    int row{0};

    bool operator==(const CellAddress& o) const noexcept {
        return column == o.column && row == o.row;
    }
    bool operator!=(const CellAddress& o) const noexcept { return !(*this == o); }
};

/// Column letters (A-Z, upper case only) followed by a row number that does not
/// start with 0: "A1", "Z99", "AB12".
bool is_valid_cell_label(std::string_view label);

/// Bijective base-26: "A" -> 0, "Z" -> 25, "AA" -> 26. Returns -1 for bad input.
int column_index(std::string_view letters);
std::string column_label(int index);

std::optional<CellAddress> parse_cell_label(std::string_view label);
std::string to_label(const CellAddress& address);

} // namespace cellexpr
