#include "board.hpp"
#include "error.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

Board::Board(std::string_view sv) : rows{}, cols{}, base{ sv }, count{ 1 } {
    auto valid = [](char ch) {
        return (ch >= '0' && ch <= '9')
            || (ch >= 'A' && ch <= 'Z')
            || (ch >= 'a' && ch <= 'z');
    };
    auto row = 0zu, col = 0zu;
    for (auto ch : sv) {
        if (ch == '\n') {
            row++, col = 0;
            continue;
        }
        if (ch == '\r')
            continue;
        if (ch != '#' && ch != '.' && ch != ' ' && !valid(ch))
            throw std::invalid_argument{ fmt::format("board: bad character '{}' at ({},{})", ch, row, col) };
        if (ch != '.' && ch != ' ') {
            if (!Shape::in_range(row, col))
                throw std::invalid_argument{ fmt::format("board: cell ({},{}) exceeds {}x{}",
                        row, col, Shape::LEN, Shape::LEN) };
            rows = std::max(rows, row + 1);
            cols = std::max(cols, col + 1);
        }
        if (valid(ch)) {
            auto it = std::ranges::find(names, ch);
            if (it == names.end()) {
                names.push_back(ch);
                regions.emplace_back();
                it = names.end() - 1;
            }
            auto &r = regions[it - names.begin()];
            r = r.set(row, col);
        }
        col++;
    }
    if (!base)
        throw std::invalid_argument{ "board: no cells" };
    for (auto r : regions)
        count *= r.size();
}

Board Board::from_file(const std::filesystem::path &path) {
    std::ifstream fin(path);
    if (!fin)
        throw std::runtime_error{ fmt::format("cannot open board file {}", path.string()) };
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return Board{ std::string_view{ buffer.str() } };
}

Board Board::rectangle(size_t rows, size_t cols) {
    std::string art;
    for (auto row = 0zu; row < rows; row++)
        art.append(cols, '#').push_back('\n');
    return Board{ art };
}

Shape Board::open(const std::vector<coords_t> &excluded) const {
    auto sh = base;
    for (auto [y, x] : excluded) {
        if (y < 0 || x < 0 || size_t(y) >= rows || size_t(x) >= cols)
            throw InvalidExcludedCell{ fmt::format("excluded cell ({},{}) outside the {}x{} board",
                    y, x, rows, cols) };
        if (!base.test(y, x))
            throw InvalidExcludedCell{ fmt::format("excluded cell ({},{}) is not on the board", y, x) };
        if (!sh.test(y, x))
            throw InvalidExcludedCell{ fmt::format("excluded cell ({},{}) given twice", y, x) };
        sh = sh.clear(y, x);
    }
    return sh;
}

coords_t Board::pick(size_t r, size_t n) const {
    if (r >= regions.size())
        throw InvalidExcludedCell{ fmt::format("board has no region #{}", r) };
    if (n < 1 || n > regions[r].size())
        throw InvalidExcludedCell{ fmt::format("region '{}' has no cell #{} (1..{})",
                names[r], n, regions[r].size()) };
    auto it = regions[r].begin();
    while (--n)
        ++it;
    return *it;
}

std::vector<coords_t> Board::date(const std::vector<size_t> &picks) const {
    if (picks.size() != regions.size())
        throw InvalidExcludedCell{ fmt::format("board expects {} date fields, got {}",
                regions.size(), picks.size()) };
    std::vector<coords_t> res;
    for (auto r = 0zu; r < picks.size(); r++)
        res.push_back(pick(r, picks[r]));
    return res;
}
