#include "naive.hpp"
#include "Piece.inl"

#include <algorithm>
#include <limits>

static size_t min_tiles(const std::vector<Piece> &lib, const std::vector<char> &used) {
    auto m = std::numeric_limits<size_t>::max();
    for (auto id = 0zu; id < lib.size(); id++)
        if (!used[id])
            m = std::min(m, lib[id].size());
    return m;
}

std::vector<Solution> solve_naive(const Board &board, const std::vector<Piece> &lib,
        Shape open, bool single) {
    std::vector<Solution> solutions;
    std::vector<char> used(lib.size(), 0);
    std::vector<Placement> history;
    auto max_tiles = 0zu;
    for (auto &p : lib)
        max_tiles += p.size();
    auto f = [&](auto &&self, Shape open_tiles) -> bool {
        if (open_tiles.size() > max_tiles)
            return false;
        if (!open_tiles) {
            if (history.size() != lib.size())
                return false;
            solutions.emplace_back(history, board.rows, board.cols);
            return single;
        }
        if (open_tiles.size() < min_tiles(lib, used))
            return false;
        auto pos = open_tiles.front();
        for (auto id = 0zu; id < lib.size(); id++) {
            if (used[id]) continue;
            used[id] = 1;
            max_tiles -= lib[id].size();
            auto stop = lib[id].cover(pos, open_tiles, [&](Shape placed, size_t trs, coords_t tra) {
                history.push_back(Placement{ id, trs, tra, placed });
                auto done = self(self, open_tiles - placed);
                history.pop_back();
                return done;
            });
            max_tiles += lib[id].size();
            used[id] = 0;
            if (stop)
                return true;
        }
        return false;
    };
    f(f, open);
    return solutions;
}
