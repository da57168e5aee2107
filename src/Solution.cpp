#include "Solution.hpp"
#include "error.hpp"

#include <algorithm>
#include <ranges>

Solution::Solution(std::vector<Placement> st, size_t rows, size_t cols)
    : steps{ std::move(st) }, map(rows, std::vector<ssize_t>(cols, -1)) {
    Shape seen{};
    for (auto it = steps.begin(); it != steps.end(); ++it) {
        if (std::find_if(steps.begin(), it, [&](const Placement &p) {
                    return p.piece_id == it->piece_id; }) != it)
            throw MalformedSolution{ fmt::format("piece #{} placed twice", it->piece_id) };
        if (seen & it->shape)
            throw MalformedSolution{ fmt::format("piece #{} overlaps an earlier placement\n{}",
                    it->piece_id, seen & it->shape) };
        seen = seen | it->shape;
        for (auto [y, x] : it->shape) {
            if (size_t(y) >= rows || size_t(x) >= cols)
                throw MalformedSolution{ fmt::format("piece #{} leaves the {}x{} board at ({},{})",
                        it->piece_id, rows, cols, y, x) };
            map[y][x] = ssize_t(it->piece_id);
        }
    }
}

Shape Solution::covered() const {
    Shape sh{};
    for (auto &st : steps)
        sh = sh | st.shape;
    return sh;
}

std::vector<std::pair<size_t, Shape::shape_t>> Solution::key() const {
    std::vector<std::pair<size_t, Shape::shape_t>> k;
    for (auto &st : steps)
        k.emplace_back(st.piece_id, st.shape.get_value());
    std::ranges::sort(k);
    return k;
}

std::string Solution::to_string(const std::vector<Piece> &lib) const {
    // initials when they tell the pieces apart, else the index in base 36
    auto by_initial = std::ranges::none_of(lib, [](const Piece &p) { return p.name.empty(); });
    for (auto i = 0zu; by_initial && i < lib.size(); i++)
        for (auto j = 0zu; j < i; j++)
            if (lib[i].name.front() == lib[j].name.front()) {
                by_initial = false;
                break;
            }
    std::string txt;
    for (auto &row : map) {
        for (auto id : row)
            if (id < 0 || size_t(id) >= lib.size())
                txt.push_back('.');
            else if (by_initial)
                txt.push_back(lib[id].name.front());
            else if (id < 10)
                txt.push_back(char('0' + id));
            else if (id < 36)
                txt.push_back(char('a' + id - 10));
            else
                txt.push_back('?');
        txt.push_back('\n');
    }
    return txt;
}

Solution decode(const Matrix &mx, const std::vector<size_t> &selected, size_t rows, size_t cols) {
    std::vector<Placement> st;
    st.reserve(selected.size());
    for (auto r : selected)
        st.push_back(mx.rows.at(r));
    return Solution{ std::move(st), rows, cols };
}
