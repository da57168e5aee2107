#pragma once

#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

using coords_t = std::pair<int, int>; // Y, X

// set of cells on an 8x8 grid, bit (Y * LEN + X)
class Shape {
public:
    static constexpr size_t LEN = 8;
    using shape_t = uint64_t;

private:
    static constexpr shape_t ROW0 = 0xffull;
    static constexpr shape_t COL0 = 0x0101010101010101ull;

    shape_t value;

    // bit X set iff some cell sits in column X
    [[nodiscard]] constexpr unsigned columns() const {
        auto v = value;
        v |= v >> 32u;
        v |= v >> 16u;
        v |= v >> 8u;
        return unsigned(v & ROW0);
    }

    // bit Y set iff some cell sits in row Y
    [[nodiscard]] constexpr unsigned rows() const {
        auto m = 0u;
        for (auto y = 0zu; y < LEN; y++)
            if (value >> (y * LEN) & ROW0)
                m |= 1u << y;
        return m;
    }

public:
    constexpr Shape() : value{} { }
    explicit constexpr Shape(shape_t v) : value{ v } { }

    // '#' or any letter or digit is a cell, anything else is not; '\n' starts a new row;
    // whatever falls beyond LEN x LEN is dropped
    explicit Shape(std::string_view sv);

    constexpr explicit operator bool() const { return value; }
    [[nodiscard]] constexpr bool operator==(const Shape &other) const = default;

    // a <= b iff every cell of a is in b
    [[nodiscard]] constexpr std::partial_ordering operator<=>(const Shape &other) const {
        auto both = value & other.value;
        if (value == other.value)
            return std::partial_ordering::equivalent;
        if (both == value)
            return std::partial_ordering::less;
        if (both == other.value)
            return std::partial_ordering::greater;
        return std::partial_ordering::unordered;
    }

    [[nodiscard]] constexpr shape_t get_value() const { return value; }
    [[nodiscard]] constexpr size_t size() const { return std::popcount(value); }

    // bounding box; margins of an empty shape are LEN
    [[nodiscard]] constexpr size_t left() const { return std::countr_zero(columns() | 1u << LEN); }
    [[nodiscard]] constexpr size_t top() const { return std::countr_zero(rows() | 1u << LEN); }
    [[nodiscard]] constexpr size_t width() const { return value ? std::bit_width(columns()) - left() : 0; }
    [[nodiscard]] constexpr size_t height() const { return value ? std::bit_width(rows()) - top() : 0; }
    [[nodiscard]] constexpr size_t right() const { return LEN - left() - width(); }
    [[nodiscard]] constexpr size_t bottom() const { return LEN - top() - height(); }

    [[nodiscard]] constexpr Shape operator|(Shape other) const { return Shape{ value | other.value }; }
    [[nodiscard]] constexpr Shape operator&(Shape other) const { return Shape{ value & other.value }; }
    [[nodiscard]] constexpr Shape operator-(Shape other) const { return Shape{ value & ~other.value }; }

    // top row and left column touch the origin
    [[nodiscard]] constexpr Shape normalize() const {
        if (!value)
            return *this;
        return Shape{ value >> (top() * LEN + left()) };
    }

    [[nodiscard]] static constexpr bool in_range(int row, int col) {
        return row >= 0 && col >= 0 && row < int(LEN) && col < int(LEN);
    }

    [[nodiscard]] constexpr bool test(size_t row, size_t col) const {
        return value >> (row * LEN + col) & 1u;
    }
    [[nodiscard]] constexpr bool test(coords_t pos) const { return test(pos.first, pos.second); }

    [[nodiscard]] constexpr Shape set(size_t row, size_t col) const {
        return Shape{ value | 1ull << (row * LEN + col) };
    }
    [[nodiscard]] constexpr Shape set(coords_t pos) const { return set(pos.first, pos.second); }

    [[nodiscard]] constexpr Shape clear(size_t row, size_t col) const {
        return Shape{ value & ~(1ull << (row * LEN + col)) };
    }
    [[nodiscard]] constexpr Shape clear(coords_t pos) const { return clear(pos.first, pos.second); }

    // FlipX and FlipY mirror the grid first, then Swap exchanges Y and X:
    //   <0,0,0> identity     <1,0,0> transpose
    //   <0,1,0> mirror X     <1,1,0> rot90 CCW, (Y, X) -> (LEN-1-X, Y)
    //   <0,0,1> mirror Y     <1,0,1> rot90 CW,  (Y, X) -> (X, LEN-1-Y)
    //   <0,1,1> rot180       <1,1,1> anti-transpose
    template <bool Swap, bool FlipX, bool FlipY>
    [[nodiscard]] Shape transform(bool norm) const;

    // the 8 transforms above, in that order (left column first)
    [[nodiscard]] std::array<Shape, 8> transforms(bool norm) const;

    // cells pushed off the grid are lost
    [[nodiscard]] Shape translate(int x, int y) const;
    [[nodiscard]] Shape translate(coords_t d) const { return translate(d.second, d.first); }

    // caller guarantees nothing leaves the grid
    [[nodiscard]] constexpr Shape translate_unsafe(int x, int y) const {
        return Shape{ value << (LEN * y + x) };
    }

    // first cell in row-major order
    [[nodiscard]] constexpr coords_t front() const {
        auto id = std::countr_zero(value);
        return { id / int(LEN), id % int(LEN) };
    }

    struct bits_proxy {
        shape_t v;
        bool operator==(const bits_proxy &other) const = default;
        constexpr coords_t operator*() const {
            return Shape{ v }.front();
        }
        constexpr bits_proxy &operator++() {
            v &= v - 1u;
            return *this;
        }
    };
    constexpr bits_proxy begin() const { return { value }; }
    constexpr bits_proxy end() const { return { 0 }; }

    // bit i set iff transforms(true)[i] == normalize()
    [[nodiscard]] unsigned symmetry() const;

    // 4-connected and non-empty
    [[nodiscard]] bool connected() const;

    // '#' for cells, '.' otherwise, one line per row
    [[nodiscard]] std::string to_string(size_t rows = LEN, size_t cols = LEN) const;
};

template <>
struct fmt::formatter<Shape> : formatter<string_view> {
    auto format(Shape c, format_context &ctx) const
        -> format_context::iterator;
};

extern template Shape Shape::transform<false, false, false>(bool norm) const;
extern template Shape Shape::transform<false, true,  false>(bool norm) const;
extern template Shape Shape::transform<false, false, true >(bool norm) const;
extern template Shape Shape::transform<false, true,  true >(bool norm) const;
extern template Shape Shape::transform<true,  false, false>(bool norm) const;
extern template Shape Shape::transform<true,  true,  false>(bool norm) const;
extern template Shape Shape::transform<true,  false, true >(bool norm) const;
extern template Shape Shape::transform<true,  true,  true >(bool norm) const;
