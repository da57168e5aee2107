#include "search.hpp"

#include <utility>

#include <boost/container/small_vector.hpp>

bool Search::run(auto &&func) {
    return step(func);
}

bool Search::step(auto &&func) {
    auto c = dlx.choose_column();
    if (!c) {
        n_solutions++;
        return func(std::as_const(stack));
    }
    if (!dlx.size(*c))
        return false; // dead end

    auto h = Dlx::header(*c);
    for (auto r = dlx.node(h).d; r != h; r = dlx.node(r).d) {
        n_nodes++;
        stack.push_back(dlx.node(r).row);
        // at most one cell column per piece cell plus the piece column
        boost::container::small_vector<size_t, 16zu> covered{ *c };
        dlx.cover(*c);
        for (auto j = dlx.node(r).r; j != r; j = dlx.node(j).r) {
            covered.push_back(dlx.node(j).col);
            dlx.cover(dlx.node(j).col);
        }
        auto stop = step(func);
        for (auto it = covered.rbegin(); it != covered.rend(); ++it)
            dlx.uncover(*it);
        stack.pop_back();
        if (stop)
            return true;
    }
    return false;
}
