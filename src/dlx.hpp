#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

// dancing links over an index-addressed arena
//   nodes[0]           root of the header list
//   nodes[1..columns]  column headers
//   nodes[columns+1..] one node per (row, column) incidence, rows stored contiguously
// NOT thread-safe; copy it to search from several threads
class Dlx {
public:
    using link_t = uint32_t;

    struct Node {
        link_t l, r, u, d;
        link_t col; // column id, not header index
        link_t row; // row id; unused for headers
        bool operator==(const Node &other) const = default;
    };

    explicit Dlx(size_t columns);

    Dlx(const Dlx &other) = default;
    Dlx(Dlx &&other) noexcept = default;
    Dlx &operator=(const Dlx &other) = default;
    Dlx &operator=(Dlx &&other) noexcept = default;

    // cols must be distinct and < columns(); returns the row id
    size_t add_row(const std::vector<size_t> &cols);

    // unlink column c from the header list and every row of c from its other columns;
    // the vertical list of c itself is left intact for uncover
    void cover(size_t c);

    // undo the matching cover; covers and uncovers nest strictly LIFO
    void uncover(size_t c);

    // live column with the fewest rows, earliest declared on ties;
    // std::nullopt once every column is covered
    [[nodiscard]] std::optional<size_t> choose_column() const;

    [[nodiscard]] size_t columns() const { return n_columns; }
    [[nodiscard]] size_t rows() const { return n_rows; }
    [[nodiscard]] size_t size(size_t c) const { return sizes[c]; }
    [[nodiscard]] size_t live_columns() const;

    [[nodiscard]] static constexpr link_t header(size_t c) { return link_t(c + 1); }
    [[nodiscard]] const Node &node(link_t i) const { return nodes[i]; }

    bool operator==(const Dlx &other) const = default;

private:
    size_t n_columns, n_rows;
    std::vector<Node> nodes;
    std::vector<link_t> sizes;
};
