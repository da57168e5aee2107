#include "Piece.inl"
#include "error.hpp"

#include <algorithm>
#include <limits>
#include <ranges>

Piece::Piece(std::string nm, Shape s) : name{ std::move(nm) }, canonical{ s.normalize() } {
    if (!canonical)
        throw InvalidPieceShape{ fmt::format("piece {}: empty shape", name) };
    if (!canonical.connected())
        throw InvalidPieceShape{ fmt::format("piece {}: disconnected shape\n{}", name, canonical) };
    auto trs = 0zu;
    for (auto sh : canonical.transforms(true)) {
        if (std::ranges::find(orientations, sh, &Orientation::normal) == orientations.end())
            orientations.push_back(Orientation{
                    sh, coords_t{ int(sh.bottom()), int(sh.right()) }, trs });
        trs++;
    }
}

Piece Piece::from_offsets(std::string nm, const std::vector<coords_t> &offsets) {
    if (offsets.empty())
        throw InvalidPieceShape{ fmt::format("piece {}: no cells", nm) };
    auto minY = std::numeric_limits<int>::max(), minX = minY;
    for (auto [y, x] : offsets)
        minY = std::min(minY, y), minX = std::min(minX, x);
    Shape sh{};
    for (auto [y, x] : offsets) {
        if (!Shape::in_range(y - minY, x - minX))
            throw InvalidPieceShape{ fmt::format("piece {}: ({},{}) exceeds {}x{}",
                    nm, y, x, Shape::LEN, Shape::LEN) };
        if (sh.test(y - minY, x - minX))
            throw InvalidPieceShape{ fmt::format("piece {}: duplicated cell ({},{})", nm, y, x) };
        sh = sh.set(y - minY, x - minX);
    }
    return Piece{ std::move(nm), sh };
}

Piece Piece::from_path(std::string nm, std::string_view edges) {
    std::vector<coords_t> offsets{ { 0, 0 } };
    auto [y, x] = offsets.front();
    auto trim = [](std::string_view sv) {
        while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
            sv.remove_prefix(1);
        while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
            sv.remove_suffix(1);
        return sv;
    };
    for (auto tok : edges | std::views::split(',')) {
        auto e = trim(std::string_view{ tok.begin(), tok.end() });
        if (e.empty())
            throw InvalidPieceShape{ fmt::format("piece {}: empty move in '{}'", nm, edges) };
        if (std::ranges::count(e, e.front()) != ssize_t(e.size()))
            throw InvalidPieceShape{ fmt::format("piece {}: mixed move '{}'", nm, e) };
        auto len = int(e.size());
        switch (e.front()) {
            case 'U': y -= len; break;
            case 'D': y += len; break;
            case 'L': x -= len; break;
            case 'R': x += len; break;
            default:
                throw InvalidPieceShape{ fmt::format("piece {}: unknown move '{}'", nm, e) };
        }
        offsets.emplace_back(y, x);
    }
    return from_offsets(std::move(nm), offsets);
}

std::vector<Placement> placements_for(const std::vector<Piece> &lib, size_t id, Shape open) {
    std::vector<Placement> res;
    lib.at(id).cover(open, [&](Shape placed, size_t trs, coords_t tra) {
        res.push_back(Placement{ id, trs, tra, placed });
        return false;
    });
    return res;
}
