#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "board.hpp"
#include "Piece.hpp"

// 7x7: Jan..Jun, Jul..Dec, then days 1..31
[[nodiscard]] Board classic_board();
// the 8 pieces of classic_board, 41 cells in total
[[nodiscard]] std::vector<Piece> classic_pieces();

// 8x7: months, days 1..31, then Sun..Sat
[[nodiscard]] Board weekday_board();
// the 10 pieces of weekday_board, 47 cells in total
[[nodiscard]] std::vector<Piece> weekday_pieces();

// one "name path" pair per line, path as accepted by Piece::from_path;
// blank lines and lines starting with '#' are skipped
[[nodiscard]] std::vector<Piece> parse_pieces(std::string_view sv);
[[nodiscard]] std::vector<Piece> load_pieces(const std::filesystem::path &path);
