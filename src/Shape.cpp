#include "Shape.hpp"

#include <algorithm>

static constexpr bool is_cell(char ch) {
    return ch == '#'
        || (ch >= '0' && ch <= '9')
        || (ch >= 'A' && ch <= 'Z')
        || (ch >= 'a' && ch <= 'z');
}

Shape::Shape(std::string_view sv) : value{} {
    auto row = 0zu, col = 0zu;
    for (auto ch : sv) {
        if (ch == '\n') {
            row++, col = 0;
            continue;
        }
        if (is_cell(ch) && row < LEN && col < LEN)
            *this = set(row, col);
        col++;
    }
}

template <bool Swap, bool FlipX, bool FlipY>
Shape Shape::transform(bool norm) const {
    Shape sh{};
    for (auto [y, x] : *this) {
        if constexpr (FlipX) x = int(LEN) - 1 - x;
        if constexpr (FlipY) y = int(LEN) - 1 - y;
        sh = Swap ? sh.set(x, y) : sh.set(y, x);
    }
    return norm ? sh.normalize() : sh;
}

template Shape Shape::transform<false, false, false>(bool norm) const;
template Shape Shape::transform<false, true,  false>(bool norm) const;
template Shape Shape::transform<false, false, true >(bool norm) const;
template Shape Shape::transform<false, true,  true >(bool norm) const;
template Shape Shape::transform<true,  false, false>(bool norm) const;
template Shape Shape::transform<true,  true,  false>(bool norm) const;
template Shape Shape::transform<true,  false, true >(bool norm) const;
template Shape Shape::transform<true,  true,  true >(bool norm) const;

std::array<Shape, 8> Shape::transforms(bool norm) const {
    return {
        transform<false, false, false>(norm),
        transform<false, true,  false>(norm),
        transform<false, false, true >(norm),
        transform<false, true,  true >(norm),
        transform<true,  false, false>(norm),
        transform<true,  true,  false>(norm),
        transform<true,  false, true >(norm),
        transform<true,  true,  true >(norm),
    };
}

Shape Shape::translate(int x, int y) const {
    if (x <= -int(LEN) || x >= int(LEN) || y <= -int(LEN) || y >= int(LEN))
        return Shape{};
    auto v = value;
    // drop the columns that would wrap into the neighbouring row
    for (auto i = 0; i < x; i++)
        v &= ~(COL0 << (LEN - 1 - i));
    for (auto i = 0; i < -x; i++)
        v &= ~(COL0 << i);
    v = x >= 0 ? v << x : v >> -x;
    v = y >= 0 ? v << (y * LEN) : v >> (-y * LEN);
    return Shape{ v };
}

unsigned Shape::symmetry() const {
    auto c = normalize();
    auto s = 0u;
    auto t = transforms(true);
    for (auto i = 0u; i < t.size(); i++)
        if (t[i] == c)
            s |= 1u << i;
    return s;
}

bool Shape::connected() const {
    if (!value)
        return false;
    // flood fill from the first cell
    auto seen = value & -value;
    while (true) {
        auto grow = seen
            | seen >> LEN
            | seen << LEN
            | (seen & ~COL0) >> 1u
            | (seen << 1u & ~COL0);
        grow &= value;
        if (grow == seen)
            return seen == value;
        seen = grow;
    }
}

std::string Shape::to_string(size_t rows, size_t cols) const {
    rows = std::min(rows, LEN);
    cols = std::min(cols, LEN);
    std::string txt;
    txt.reserve(rows * (cols + 1));
    for (auto row = 0zu; row < rows; row++) {
        for (auto col = 0zu; col < cols; col++)
            txt.push_back(test(row, col) ? '#' : '.');
        txt.push_back('\n');
    }
    return txt;
}

auto fmt::formatter<Shape>::format(Shape c, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(c.to_string(), ctx);
}
