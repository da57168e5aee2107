#include "Piece.hpp"

bool Piece::cover(coords_t pos, Shape open, auto &&func) const {
    auto [tgtY, tgtX] = pos;
    for (auto i = 0zu; i < orientations.size(); i++) {
        auto &o = orientations[i];
        auto [maxY, maxX] = o.max;
        for (auto [bitY, bitX] : o.normal) {
            if (bitX > tgtX || bitX + maxX < tgtX)
                continue;
            if (bitY > tgtY || bitY + maxY < tgtY)
                continue;
            auto x = tgtX - bitX;
            auto y = tgtY - bitY;
            auto placed = o.normal.translate_unsafe(x, y);
            if (!(placed <= open))
                continue;
            if (func(placed, i, coords_t{ y, x }))
                return true;
        }
    }
    return false;
}

bool Piece::cover(Shape open, auto &&func) const {
    for (auto i = 0zu; i < orientations.size(); i++) {
        auto &o = orientations[i];
        auto [maxY, maxX] = o.max;
        for (auto y = 0; y <= maxY; y++)
            for (auto x = 0; x <= maxX; x++) {
                auto placed = o.normal.translate_unsafe(x, y);
                if (!(placed <= open))
                    continue;
                if (func(placed, i, coords_t{ y, x }))
                    return true;
            }
    }
    return false;
}
