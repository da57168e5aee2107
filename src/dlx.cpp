#include "dlx.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

Dlx::Dlx(size_t columns) : n_columns{ columns }, n_rows{}, sizes(columns, 0) {
    if (columns >= std::numeric_limits<link_t>::max() / 2)
        throw std::length_error{ fmt::format("dlx: {} columns is too many", columns) };
    nodes.reserve(columns + 1);
    for (auto i = 0zu; i <= columns; i++) {
        auto self = link_t(i);
        nodes.push_back(Node{
                link_t(i ? i - 1 : columns), link_t(i == columns ? 0 : i + 1),
                self, self,
                link_t(i ? i - 1 : 0), 0 });
    }
}

size_t Dlx::add_row(const std::vector<size_t> &cols) {
    if (cols.empty())
        throw std::invalid_argument{ fmt::format("dlx: row {} is empty", n_rows) };
    for (auto it = cols.begin(); it != cols.end(); ++it) {
        if (*it >= n_columns)
            throw std::out_of_range{ fmt::format("dlx: row {} names column {} of {}",
                    n_rows, *it, n_columns) };
        if (std::find(cols.begin(), it, *it) != it)
            throw std::invalid_argument{ fmt::format("dlx: row {} names column {} twice",
                    n_rows, *it) };
    }
    if (nodes.size() + cols.size() >= std::numeric_limits<link_t>::max())
        throw std::length_error{ "dlx: arena exhausted" };

    auto first = link_t(nodes.size());
    auto last = link_t(first + cols.size() - 1);
    auto row = link_t(n_rows);
    for (auto c : cols) {
        auto self = link_t(nodes.size());
        auto h = header(c);
        // append at the bottom of column c
        nodes.push_back(Node{
                self == first ? last : self - 1, self == last ? first : self + 1,
                nodes[h].u, h,
                link_t(c), row });
        nodes[nodes[h].u].d = self;
        nodes[h].u = self;
        sizes[c]++;
    }
    return n_rows++;
}

void Dlx::cover(size_t c) {
    auto h = header(c);
    nodes[nodes[h].r].l = nodes[h].l;
    nodes[nodes[h].l].r = nodes[h].r;
    for (auto i = nodes[h].d; i != h; i = nodes[i].d)
        for (auto j = nodes[i].r; j != i; j = nodes[j].r) {
            nodes[nodes[j].d].u = nodes[j].u;
            nodes[nodes[j].u].d = nodes[j].d;
            sizes[nodes[j].col]--;
        }
}

void Dlx::uncover(size_t c) {
    auto h = header(c);
    for (auto i = nodes[h].u; i != h; i = nodes[i].u)
        for (auto j = nodes[i].l; j != i; j = nodes[j].l) {
            sizes[nodes[j].col]++;
            nodes[nodes[j].d].u = j;
            nodes[nodes[j].u].d = j;
        }
    nodes[nodes[h].r].l = h;
    nodes[nodes[h].l].r = h;
}

std::optional<size_t> Dlx::choose_column() const {
    std::optional<size_t> best;
    auto min = std::numeric_limits<link_t>::max();
    for (auto h = nodes[0].r; h != 0; h = nodes[h].r) {
        auto c = nodes[h].col;
        if (sizes[c] < min) {
            min = sizes[c], best = c;
            if (!min)
                break;
        }
    }
    return best;
}

size_t Dlx::live_columns() const {
    auto n = 0zu;
    for (auto h = nodes[0].r; h != 0; h = nodes[h].r)
        n++;
    return n;
}
