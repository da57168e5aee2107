#include "matrix.hpp"

Matrix build_matrix(const std::vector<Piece> &lib, Shape open) {
    Matrix mx{ open, lib.size(), {}, {}, {} };
    mx.cell_column.fill(-1);
    for (auto pos : open) {
        mx.cell_column[pos.first * Shape::LEN + pos.second] = int(mx.cells.size());
        mx.cells.push_back(pos);
    }
    for (auto id = 0zu; id < lib.size(); id++) {
        auto pl = placements_for(lib, id, open);
        mx.rows.insert(mx.rows.end(), pl.begin(), pl.end());
    }
    return mx;
}

std::vector<size_t> Matrix::row_columns(size_t r) const {
    auto &p = rows.at(r);
    std::vector<size_t> cols;
    cols.reserve(p.shape.size() + 1);
    for (auto [y, x] : p.shape)
        cols.push_back(cell_column[y * Shape::LEN + x]);
    cols.push_back(cells.size() + p.piece_id);
    return cols;
}

Dlx Matrix::to_dlx() const {
    Dlx dlx{ columns() };
    for (auto r = 0zu; r < rows.size(); r++)
        dlx.add_row(row_columns(r));
    return dlx;
}
