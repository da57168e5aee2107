#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

#include "board.hpp"
#include "Piece.hpp"
#include "Solution.hpp"

struct SolveStats {
    size_t columns, rows;
    uint64_t nodes;
};

// exact covers of open by every piece of lib, in discovery order;
// at most one if single, none if the date is unsolvable
[[nodiscard]] std::vector<Solution> solve(const Board &board, const std::vector<Piece> &lib,
        Shape open, bool single, SolveStats *stats = nullptr);

// throws InvalidExcludedCell before building anything
[[nodiscard]] std::vector<Solution> solve(const Board &board, const std::vector<Piece> &lib,
        const std::vector<coords_t> &excluded, bool single, SolveStats *stats = nullptr);

// std::nullopt iff unsolvable
[[nodiscard]] std::optional<Solution> solve_first(const Board &board, const std::vector<Piece> &lib,
        Shape open);

[[nodiscard]] uint64_t solve_count(const std::vector<Piece> &lib, Shape open);

// same result and order as solve(..., false), the rows of the first chosen column
// being searched on separate copies of the matrix; threads == 0 means hardware concurrency
[[nodiscard]] std::vector<Solution> solve_parallel(const Board &board, const std::vector<Piece> &lib,
        Shape open, unsigned threads = 0);

// counts the solutions of every configuration of a board
class Sweeper {
    uint64_t configs_issue_counter{};
    std::atomic<uint64_t> work_counter, configs_counter;

protected:
    const Board &board;
    const std::vector<Piece> &lib;

public:
    Sweeper(const Board &b, const std::vector<Piece> &l)
        : work_counter{}, configs_counter{}, board{ b }, lib{ l } { }
    virtual ~Sweeper() { }

    // threads == 0 means hardware concurrency; rethrows the first failure
    void run(unsigned threads = 0);
    void run1();

    // solutions found so far
    [[nodiscard]] uint64_t work_done() const {
        return work_counter.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t configs_done() const {
        return configs_counter.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t configs_issued() const {
        return configs_issue_counter;
    }

protected:
    // whether the i-th board config should run
    [[nodiscard]] virtual bool should_run(uint64_t i, Shape open) { return true; }

    // called from worker threads
    virtual void after_run(uint64_t i, Shape open, uint64_t cnt, uint64_t ms);

private:
    void run_one(uint64_t i, Shape open);
};
