#pragma once

#include <cstdint>
#include <vector>

#include "dlx.hpp"

// Algorithm X over a Dlx, mutated in place and restored on return
// NOT thread-safe at all!
class Search {
    Dlx &dlx;
    std::vector<size_t> stack; // selected row ids
    std::vector<std::vector<size_t>> preselected; // columns covered by select()
    uint64_t n_nodes, n_solutions;

public:
    explicit Search(Dlx &d) : dlx{ d }, n_nodes{}, n_solutions{} { }
    Search(const Search &other) = delete;
    ~Search();

    // commit row r (through node n) before run(); columns of r must be live
    void select(Dlx::link_t n);

    // bool func(const std::vector<size_t> &rows) for every exact cover -> true to stop
    // returns true iff func asked to stop
    bool run(auto &&func);

    [[nodiscard]] uint64_t nodes() const { return n_nodes; }
    [[nodiscard]] uint64_t solutions() const { return n_solutions; }

private:
    bool step(auto &&func);
};
