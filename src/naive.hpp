#pragma once

#include <vector>

#include "board.hpp"
#include "Piece.hpp"
#include "Solution.hpp"

// plain backtracking on the first open cell, no exact-cover machinery;
// slow, only meant to cross-check solve()
[[nodiscard]] std::vector<Solution> solve_naive(const Board &board, const std::vector<Piece> &lib,
        Shape open, bool single);
