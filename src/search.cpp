#include "search.hpp"

Search::~Search() {
    while (!preselected.empty()) {
        auto &cols = preselected.back();
        for (auto it = cols.rbegin(); it != cols.rend(); ++it)
            dlx.uncover(*it);
        preselected.pop_back();
        stack.pop_back();
    }
}

void Search::select(Dlx::link_t n) {
    std::vector<size_t> cols{ dlx.node(n).col };
    for (auto j = dlx.node(n).r; j != n; j = dlx.node(j).r)
        cols.push_back(dlx.node(j).col);
    for (auto c : cols)
        dlx.cover(c);
    stack.push_back(dlx.node(n).row);
    preselected.push_back(std::move(cols));
}
