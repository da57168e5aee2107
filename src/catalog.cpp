#include "catalog.hpp"
#include "error.hpp"

#include <fstream>
#include <ranges>
#include <sstream>
#include <stdexcept>

Board classic_board() {
    return Board{
        "mmmmmm.\n"
        "mmmmmm.\n"
        "ddddddd\n"
        "ddddddd\n"
        "ddddddd\n"
        "ddddddd\n"
        "ddd....\n" };
}

std::vector<Piece> classic_pieces() {
    return {
        Piece{ "L", Shape{ "####\n#..." } },
        Piece{ "N", Shape{ "###.\n..##" } },
        Piece{ "S", Shape{ ".##\n.#.\n##." } },
        Piece{ "V", Shape{ "#..\n#..\n###" } },
        Piece{ "O", Shape{ "###\n###" } },
        Piece{ "P", Shape{ "###\n##." } },
        Piece{ "U", Shape{ "###\n#.#" } },
        Piece{ "Y", Shape{ "####\n.#.." } },
    };
}

Board weekday_board() {
    return Board{
        "mmmmmm.\n"
        "mmmmmm.\n"
        "ddddddd\n"
        "ddddddd\n"
        "ddddddd\n"
        "ddddddd\n"
        "dddwwww\n"
        "....www\n" };
}

std::vector<Piece> weekday_pieces() {
    return parse_pieces(
        "# pentominoes\n"
        "L L,U,U,U\n"
        "T R,R,U,DD\n"
        "P R,R,D,L\n"
        "N R,U,R,R\n"
        "V R,R,D,D\n"
        "U U,R,R,D\n"
        "Z R,D,D,R\n"
        "# tetrominoes\n"
        "I R,R,R\n"
        "S R,U,R\n"
        "J L,U,U\n");
}

std::vector<Piece> parse_pieces(std::string_view sv) {
    std::vector<Piece> lib;
    auto lineno = 0zu;
    for (auto rg : sv | std::views::split('\n')) {
        lineno++;
        std::string_view line{ rg.begin(), rg.end() };
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.remove_suffix(1);
        while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
            line.remove_prefix(1);
        if (line.empty() || line.front() == '#')
            continue;
        auto sp = line.find_first_of(" \t");
        if (sp == std::string_view::npos)
            throw InvalidPieceShape{ fmt::format("line {}: expected 'name path', got '{}'", lineno, line) };
        std::string name{ line.substr(0, sp) };
        for (auto &p : lib)
            if (p.name == name)
                throw InvalidPieceShape{ fmt::format("line {}: piece {} defined twice", lineno, name) };
        lib.push_back(Piece::from_path(std::move(name), line.substr(sp + 1)));
    }
    return lib;
}

std::vector<Piece> load_pieces(const std::filesystem::path &path) {
    std::ifstream fin(path);
    if (!fin)
        throw std::runtime_error{ fmt::format("cannot open piece file {}", path.string()) };
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return parse_pieces(buffer.str());
}
