#pragma once

#include <array>
#include <vector>

#include "dlx.hpp"
#include "Piece.hpp"

// exact-cover instance:
//   columns [0, cells.size()) are the open cells in row-major order,
//   columns [cells.size(), columns()) are the pieces in library order;
//   rows are the legal placements, piece-major, then orientation, then anchor
struct Matrix {
    Shape open;
    size_t n_pieces;
    std::vector<coords_t> cells;
    std::array<int, Shape::LEN * Shape::LEN> cell_column; // -1 if not open
    std::vector<Placement> rows;

    [[nodiscard]] size_t columns() const { return cells.size() + n_pieces; }

    // cell columns ascending, then the piece column
    [[nodiscard]] std::vector<size_t> row_columns(size_t r) const;

    [[nodiscard]] Dlx to_dlx() const;
};

[[nodiscard]] Matrix build_matrix(const std::vector<Piece> &lib, Shape open);
