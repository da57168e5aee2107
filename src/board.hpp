#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "Shape.hpp"

// board art, one text line per row:
//   '#'       plain cell
//   '.', ' '  no cell
//   [0-9A-Za-z] cell belonging to the region named by that character
// regions are ordered by first appearance; each date excludes one cell per region
struct Board {
    size_t rows, cols;
    Shape base;
    std::vector<char> names;
    std::vector<Shape> regions;
    size_t count; // number of configurations

    explicit Board(std::string_view sv);

    static Board from_file(const std::filesystem::path &path);
    static Board rectangle(size_t rows, size_t cols);

    // base minus excluded; throws InvalidExcludedCell
    [[nodiscard]] Shape open(const std::vector<coords_t> &excluded) const;

    // n-th (1-based, row-major) cell of region r; throws InvalidExcludedCell
    [[nodiscard]] coords_t pick(size_t r, size_t n) const;

    // one pick per region, in region order
    [[nodiscard]] std::vector<coords_t> date(const std::vector<size_t> &picks) const;

    [[nodiscard]] std::string to_string() const {
        return base.to_string(rows, cols);
    }

    // void func(Shape open) for every configuration, regions varying last-fastest
    void foreach(auto &&func) const {
        auto f = [&,end=regions.end()](auto &&self, auto it, Shape curr) -> void {
            if (it == end) {
                func(curr);
                return;
            }
            for (auto pos : *it++)
                self(self, it, curr.clear(pos));
        };
        f(f, regions.begin(), base);
    }
};
