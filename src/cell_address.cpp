#include "cellexpr/cell_address.hpp"
#include <algorithm>
#include <limits>

namespace cellexpr {

static bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }
static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::size_t letters_end(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size() && is_upper(s[i])) ++i;
    return i;
}

bool is_valid_cell_label(std::string_view label) {
    return parse_cell_label(label).has_value();
}

int column_index(std::string_view letters) {
    if (letters.empty()) return -1;
    long long acc = 0;
    for (char c : letters) {
        if (!is_upper(c)) return -1;
        acc = acc * 26 + (c - 'A' + 1);
        if (acc > std::numeric_limits<int>::max()) return -1;
    }
    return static_cast<int>(acc - 1);
}

std::string column_label(int index) {
    std::string out;
    if (index < 0) return out;
    long long n = static_cast<long long>(index) + 1;
    while (n > 0) {
        --n;
        out.push_back(static_cast<char>('A' + n % 26));
        n /= 26;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<CellAddress> parse_cell_label(std::string_view label) {
    std::size_t split = letters_end(label);
    if (split == 0 || split == label.size()) return std::nullopt;

    std::string_view digits = label.substr(split);
    if (digits.front() == '0') return std::nullopt;

    long long row = 0;
    for (char c : digits) {
        if (!is_digit(c)) return std::nullopt;
        row = row * 10 + (c - '0');
        if (row > std::numeric_limits<int>::max()) return std::nullopt;
    }

    int column = column_index(label.substr(0, split));
    if (column < 0) return std::nullopt;

    return CellAddress{column, static_cast<int>(row - 1)};
}

std::string to_label(const CellAddress& address) {
    return column_label(address.column) + std::to_string(static_cast<long long>(address.row) + 1);
}

} // namespace cellexpr
