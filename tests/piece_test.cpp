#include <gtest/gtest.h>

#include <bit>
#include <stdexcept>
#include <vector>

#include "catalog.hpp"
#include "error.hpp"
#include "Piece.inl"

TEST(Piece, OrbitIsDeduplicated) {
    EXPECT_EQ(Piece("O", Shape{ "##\n##" }).orientations.size(), 1u);
    EXPECT_EQ(Piece("I", Shape{ "####" }).orientations.size(), 2u);
    EXPECT_EQ(Piece("L", Shape{ "###\n#.." }).orientations.size(), 8u);
    EXPECT_EQ(Piece("T", Shape{ "###\n.#." }).orientations.size(), 4u);
}

TEST(Piece, OrbitMatchesSymmetry) {
    for (auto &lib : { classic_pieces(), weekday_pieces() })
        for (auto &p : lib) {
            auto stab = std::popcount(p.canonical.symmetry());
            EXPECT_EQ(p.orientations.size() * stab, 8u) << p.name;
            for (auto &o : p.orientations) {
                EXPECT_EQ(o.normal.normalize(), o.normal) << p.name;
                EXPECT_EQ(o.normal.size(), p.size()) << p.name;
            }
        }
}

TEST(Piece, CatalogOrientations) {
    std::vector<size_t> classic, weekday;
    for (auto &p : classic_pieces())
        classic.push_back(p.orientations.size());
    for (auto &p : weekday_pieces())
        weekday.push_back(p.orientations.size());
    EXPECT_EQ(classic, (std::vector<size_t>{ 8, 8, 4, 4, 2, 8, 4, 8 }));
    EXPECT_EQ(weekday, (std::vector<size_t>{ 8, 4, 8, 8, 4, 4, 4, 2, 4, 8 }));
}

TEST(Piece, CanonicalIsNormalized) {
    Piece p{ "d", Shape{}.set(2, 3).set(2, 4) };
    EXPECT_EQ(p.canonical, Shape{ "##" });
    EXPECT_EQ(p.orientations.front().trs, 0u);
    EXPECT_EQ(p.orientations.front().normal, p.canonical);
}

TEST(Piece, FromPath) {
    EXPECT_EQ(Piece::from_path("T", "R,R,U,DD").canonical, Shape{ "..#\n###\n..#" });
    EXPECT_EQ(Piece::from_path("L", "L,U,U,U").canonical, Shape{ "#.\n#.\n#.\n##" });
    EXPECT_EQ(Piece::from_path("I", "R, R, R").canonical, Shape{ "####" });
}

TEST(Piece, FromOffsetsAcceptsNegative) {
    auto p = Piece::from_offsets("S", { { 0, 0 }, { 0, -1 }, { -1, 0 }, { -1, 1 } });
    EXPECT_EQ(p.canonical, Shape{ ".##\n##." });
}

TEST(Piece, RejectsBadShapes) {
    EXPECT_THROW(Piece("E", Shape{}), InvalidPieceShape);
    EXPECT_THROW(Piece("D", Shape{ "#.\n.#" }), InvalidPieceShape);
    EXPECT_THROW(Piece::from_offsets("E", {}), InvalidPieceShape);
    EXPECT_THROW((Piece::from_offsets("D", { { 0, 0 }, { 0, 1 }, { 0, 0 } })), InvalidPieceShape);
    EXPECT_THROW((Piece::from_offsets("W", { { 0, 0 }, { 0, 8 } })), InvalidPieceShape);
    EXPECT_THROW(Piece::from_path("W", "RRRRRRRR"), InvalidPieceShape);
    EXPECT_THROW(Piece::from_path("G", "RR"), InvalidPieceShape);   // skips a cell
    EXPECT_THROW(Piece::from_path("B", "R,L"), InvalidPieceShape);  // revisits the start
    EXPECT_THROW(Piece::from_path("X", "R,X"), InvalidPieceShape);
    EXPECT_THROW(Piece::from_path("X", "R,,R"), InvalidPieceShape);
    EXPECT_THROW(Piece::from_path("X", "RU"), InvalidPieceShape);
}

TEST(Piece, PlacementsOnSquare) {
    std::vector<Piece> lib{ Piece{ "d", Shape{ "##" } } };
    auto pl = placements_for(lib, 0, Shape{ "##\n##" });
    ASSERT_EQ(pl.size(), 4u);
    // orientation-major, anchor row-major
    EXPECT_EQ(pl[0].shape, Shape{ "##" });
    EXPECT_EQ(pl[1].shape, Shape{ "..\n##" });
    EXPECT_EQ(pl[2].shape, Shape{ "#\n#" });
    EXPECT_EQ(pl[3].shape, Shape{ ".#\n.#" });
    EXPECT_EQ(pl[0].trs_id, 0u);
    EXPECT_EQ(pl[2].trs_id, 1u);
    EXPECT_EQ(pl[1].anchor, (coords_t{ 1, 0 }));
    EXPECT_EQ(pl[3].anchor, (coords_t{ 0, 1 }));
    for (auto &p : pl) {
        EXPECT_EQ(p.piece_id, 0u);
        EXPECT_EQ(lib[0].orientations[p.trs_id].normal.translate(p.anchor.second, p.anchor.first),
                p.shape);
    }
}

TEST(Piece, CoverThroughCell) {
    Piece l{ "L", Shape{ "###\n#.." } };
    Shape full{ ~0ull };
    auto n = 0zu;
    l.cover(coords_t{ 3, 3 }, full, [&](Shape placed, size_t, coords_t) {
        EXPECT_TRUE(placed.test(3, 3));
        n++;
        return false;
    });
    EXPECT_EQ(n, 32u);

    n = 0;
    EXPECT_TRUE(l.cover(coords_t{ 3, 3 }, full, [&](Shape, size_t, coords_t) {
        return ++n == 5;
    }));
    EXPECT_EQ(n, 5u);

    // a 2x2 hole holds no L tetromino
    EXPECT_FALSE(l.cover(coords_t{ 0, 0 }, Shape{ "##\n##" }, [](Shape, size_t, coords_t) {
        return true;
    }));
}

TEST(Piece, ParsePieces) {
    auto lib = parse_pieces(
        "# comment\n"
        "\n"
        "  T R,R,U,DD\r\n"
        "I\tR,R,R\n");
    ASSERT_EQ(lib.size(), 2u);
    EXPECT_EQ(lib[0].name, "T");
    EXPECT_EQ(lib[0].size(), 5u);
    EXPECT_EQ(lib[1].name, "I");
    EXPECT_EQ(lib[1].canonical, Shape{ "####" });

    EXPECT_THROW(parse_pieces("T R,R\nT U,U\n"), InvalidPieceShape);
    EXPECT_THROW(parse_pieces("T\n"), InvalidPieceShape);
    EXPECT_THROW(parse_pieces("T R,Q\n"), InvalidPieceShape);
    EXPECT_THROW(load_pieces("/nonexistent/daycover/pieces.txt"), std::runtime_error);
}
