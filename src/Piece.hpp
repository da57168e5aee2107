#pragma once

#include "Shape.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

using ssize_t = std::make_signed_t<size_t>;

// one orientation of one piece, translated onto the board
struct Placement {
    size_t piece_id, trs_id; // trs_id indexes Piece::orientations
    coords_t anchor;         // Y, X translation of the normalized orientation
    Shape shape;

    bool operator==(const Placement &other) const = default;
};

// immutable once constructed
struct Piece {
    struct Orientation {
        Shape normal;
        coords_t max; // how far normal can be translated (Y, X) within the grid
        size_t trs;   // index into Shape::transforms
    };

    std::string name;
    Shape canonical;

    // rotations and reflections, normalized and deduplicated, in Shape::transforms order
    std::vector<Orientation> orientations;

    // throws InvalidPieceShape if s is empty or not 4-connected
    Piece(std::string nm, Shape s);

    // offsets may be negative; throws InvalidPieceShape on duplicates,
    // emptiness, disconnection or anything wider than Shape::LEN
    static Piece from_offsets(std::string nm, const std::vector<coords_t> &offsets);

    // comma-separated moves from a starting cell, each landing cell being part of the piece:
    // "R,R,U,DD" walks right, right, up, then two down in a single step
    static Piece from_path(std::string nm, std::string_view edges);

    [[nodiscard]] size_t size() const { return canonical.size(); }

    // placements covering pos and fitting in open
    // bool func(Shape placed, size_t orientation, coords_t tra) -> true to stop
    bool cover(coords_t pos, Shape open, auto &&func) const;

    // every placement fitting in open
    bool cover(Shape open, auto &&func) const;
};

// every legal placement of lib[id] on the open cells, orientation-major, anchor row-major
[[nodiscard]] std::vector<Placement> placements_for(const std::vector<Piece> &lib, size_t id, Shape open);
