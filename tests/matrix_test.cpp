#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "catalog.hpp"
#include "matrix.hpp"

TEST(Matrix, DominoOnSquare) {
    std::vector<Piece> lib{ Piece{ "d", Shape{ "##" } } };
    auto mx = build_matrix(lib, Shape{ "##\n##" });
    EXPECT_EQ(mx.columns(), 5u);
    ASSERT_EQ(mx.rows.size(), 4u);
    EXPECT_EQ(mx.cells, (std::vector<coords_t>{ { 0, 0 }, { 0, 1 }, { 1, 0 }, { 1, 1 } }));
    EXPECT_EQ(mx.row_columns(0), (std::vector<size_t>{ 0, 1, 4 }));
    EXPECT_EQ(mx.row_columns(1), (std::vector<size_t>{ 2, 3, 4 }));
    EXPECT_EQ(mx.row_columns(2), (std::vector<size_t>{ 0, 2, 4 }));
    EXPECT_EQ(mx.row_columns(3), (std::vector<size_t>{ 1, 3, 4 }));
    EXPECT_THROW(mx.row_columns(4), std::out_of_range);
}

TEST(Matrix, ColumnsFollowOpenCells) {
    std::vector<Piece> lib(3, Piece{ "d", Shape{ "##" } });
    auto open = Board::rectangle(2, 4).open({ { 0, 0 }, { 1, 0 } });
    auto mx = build_matrix(lib, open);
    EXPECT_EQ(mx.cells.size(), 6u);
    EXPECT_EQ(mx.columns(), 9u);
    EXPECT_EQ(mx.rows.size(), 21u);
    EXPECT_EQ(mx.cell_column[0], -1);
    EXPECT_EQ(mx.cell_column[1], 0);
    EXPECT_EQ(mx.cell_column[Shape::LEN + 1], 3);

    // piece-major
    for (auto r = 0zu; r < mx.rows.size(); r++)
        EXPECT_EQ(mx.rows[r].piece_id, r / 7);
}

TEST(Matrix, RowsStayInsideOpen) {
    auto b = classic_board();
    auto lib = classic_pieces();
    auto open = b.open(b.date({ 1, 1 }));
    auto mx = build_matrix(lib, open);
    EXPECT_EQ(mx.columns(), 41u + 8u);
    EXPECT_FALSE(mx.rows.empty());

    for (auto r = 0zu; r < mx.rows.size(); r++) {
        auto &p = mx.rows[r];
        EXPECT_TRUE(p.shape <= open);
        EXPECT_EQ(p.shape.size(), lib[p.piece_id].size());
        auto cols = mx.row_columns(r);
        ASSERT_EQ(cols.size(), p.shape.size() + 1);
        EXPECT_TRUE(std::is_sorted(cols.begin(), cols.end() - 1));
        EXPECT_EQ(cols.back(), mx.cells.size() + p.piece_id);
        for (auto i = 0zu; i + 1 < cols.size(); i++)
            EXPECT_TRUE(p.shape.test(mx.cells[cols[i]]));
    }
}

TEST(Matrix, ToDlx) {
    auto lib = classic_pieces();
    auto b = classic_board();
    auto mx = build_matrix(lib, b.open(b.date({ 10, 19 })));
    auto dlx = mx.to_dlx();
    EXPECT_EQ(dlx.columns(), mx.columns());
    EXPECT_EQ(dlx.rows(), mx.rows.size());
    auto total = 0zu;
    for (auto c = 0zu; c < dlx.columns(); c++)
        total += dlx.size(c);
    auto expected = 0zu;
    for (auto &p : mx.rows)
        expected += p.shape.size() + 1;
    EXPECT_EQ(total, expected);
}
