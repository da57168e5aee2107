#include <gtest/gtest.h>

#include <vector>

#include "Shape.hpp"

TEST(Shape, ParsesArtRowMajor) {
    Shape sh{ ".#\n##" };
    EXPECT_EQ(sh.size(), 3u);
    EXPECT_FALSE(sh.test(0, 0));
    EXPECT_TRUE(sh.test(0, 1));
    EXPECT_TRUE(sh.test(1, 0));
    EXPECT_TRUE(sh.test(1, 1));

    std::vector<coords_t> cells;
    for (auto pos : sh)
        cells.push_back(pos);
    EXPECT_EQ(cells, (std::vector<coords_t>{ { 0, 1 }, { 1, 0 }, { 1, 1 } }));
}

TEST(Shape, NormalizeMovesToOrigin) {
    auto sh = Shape{}.set(3, 4).set(4, 4).set(4, 5);
    auto n = sh.normalize();
    EXPECT_EQ(n, Shape{}.set(0, 0).set(1, 0).set(1, 1));
    EXPECT_EQ(n.normalize(), n);
    EXPECT_EQ(n.top(), 0u);
    EXPECT_EQ(n.left(), 0u);
    EXPECT_EQ(n.height(), 2u);
    EXPECT_EQ(n.width(), 2u);
    EXPECT_EQ(n.bottom(), Shape::LEN - 2);
    EXPECT_EQ(n.right(), Shape::LEN - 2);
}

TEST(Shape, TransformsKeepSize) {
    Shape l{ "###\n#.." };
    for (auto t : l.transforms(true)) {
        EXPECT_EQ(t.size(), 4u);
        EXPECT_EQ(t.normalize(), t);
    }
    // rot180 of an L tetromino
    EXPECT_EQ((l.transform<false, true, true>(true)), (Shape{ "..#\n###" }));
}

TEST(Shape, QuarterTurnDirection) {
    Shape l{ "###\n#.." };
    // <1,1,0> turns counterclockwise, <1,0,1> clockwise
    EXPECT_EQ((l.transform<true, true, false>(true)), (Shape{ "#.\n#.\n##" }));
    EXPECT_EQ((l.transform<true, false, true>(true)), (Shape{ "##\n.#\n.#" }));
    EXPECT_EQ((Shape{}.set(0, 0).transform<true, true, false>(false)), (Shape{}.set(7, 0)));
    EXPECT_EQ((Shape{}.set(0, 0).transform<true, false, true>(false)), (Shape{}.set(0, 7)));
}

TEST(Shape, SymmetryBits) {
    EXPECT_EQ(Shape{ "##\n##" }.symmetry(), 0b11111111u);
    EXPECT_EQ(Shape{ "####" }.symmetry(), 0b00001111u);
    EXPECT_EQ(Shape{ "###\n#.." }.symmetry(), 0b00000001u);
}

TEST(Shape, TranslateDropsCellsOffTheGrid) {
    Shape sh{ "##" };
    EXPECT_EQ(sh.translate(1, 2), Shape{}.set(2, 1).set(2, 2));
    EXPECT_EQ(sh.translate(Shape::LEN - 1, 0), Shape{}.set(0, Shape::LEN - 1));
    EXPECT_EQ(sh.translate(0, -1), Shape{});
    EXPECT_EQ(sh.translate_unsafe(3, 1), sh.translate(3, 1));
}

TEST(Shape, Connectivity) {
    EXPECT_TRUE((Shape{ "#" }.connected()));
    EXPECT_TRUE((Shape{ "##\n.#\n.#" }.connected()));
    EXPECT_FALSE((Shape{ "#.\n.#" }.connected()));
    EXPECT_FALSE(Shape{}.connected());
    // no wrap-around between the last column and the next row
    EXPECT_FALSE(Shape{}.set(0, Shape::LEN - 1).set(1, 0).connected());
}

TEST(Shape, SubsetOrdering) {
    Shape a{ "##" }, b{ "###" }, c{ "#\n#" };
    EXPECT_TRUE(a <= b);
    EXPECT_FALSE(b <= a);
    EXPECT_FALSE(a <= c);
    EXPECT_FALSE(c <= a);
    EXPECT_EQ(b - a, Shape{}.set(0, 2));
}

TEST(Shape, RendersTrimmed) {
    EXPECT_EQ((Shape{ "#.\n.#" }.to_string(2, 3)), "#..\n.#.\n");
    EXPECT_EQ(fmt::format("{}", Shape{ "#" }).size(), Shape::LEN * (Shape::LEN + 1));
}
