#pragma once

#include <string>
#include <utility>
#include <vector>

#include "matrix.hpp"
#include "Piece.hpp"

struct Solution {
    std::vector<Placement> steps;
    std::vector<std::vector<ssize_t>> map; // [row][col] -> piece_id, -1 if uncovered

    // throws MalformedSolution if two steps share a cell or a piece
    Solution(std::vector<Placement> st, size_t rows, size_t cols);
    Solution(const Solution &other) = default;
    Solution(Solution &&other) noexcept = default;
    Solution &operator=(const Solution &other) = default;
    Solution &operator=(Solution &&other) noexcept = default;

    [[nodiscard]] Shape covered() const;

    // (piece_id, cells) sorted; independent of the order steps were found in
    [[nodiscard]] std::vector<std::pair<size_t, Shape::shape_t>> key() const;

    // first letter of each piece name, or the piece index in base 36 when two names
    // share a first letter; '.' for uncovered cells
    [[nodiscard]] std::string to_string(const std::vector<Piece> &lib) const;
};

// the placements behind the selected matrix rows, laid out on a rows x cols map
[[nodiscard]] Solution decode(const Matrix &mx, const std::vector<size_t> &selected,
        size_t rows, size_t cols);
