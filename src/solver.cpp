#include "solver.hpp"
#include "search.inl"

#include <chrono>
#include <exception>

#define BOOST_THREAD_VERSION 5
#include <boost/thread/executors/basic_thread_pool.hpp>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>

namespace {

unsigned pool_size(unsigned threads) {
    if (threads)
        return threads;
    auto hw = boost::thread::hardware_concurrency();
    return hw ? hw : 1u;
}

}

std::vector<Solution> solve(const Board &board, const std::vector<Piece> &lib,
        Shape open, bool single, SolveStats *stats) {
    auto mx = build_matrix(lib, open);
    auto dlx = mx.to_dlx();
    std::vector<Solution> solutions;
    Search s{ dlx };
    s.run([&](const std::vector<size_t> &rows) {
        solutions.push_back(decode(mx, rows, board.rows, board.cols));
        return single;
    });
    if (stats)
        *stats = SolveStats{ mx.columns(), mx.rows.size(), s.nodes() };
    return solutions;
}

std::vector<Solution> solve(const Board &board, const std::vector<Piece> &lib,
        const std::vector<coords_t> &excluded, bool single, SolveStats *stats) {
    return solve(board, lib, board.open(excluded), single, stats);
}

std::optional<Solution> solve_first(const Board &board, const std::vector<Piece> &lib, Shape open) {
    auto res = solve(board, lib, open, true);
    if (res.empty())
        return {};
    return std::move(res.front());
}

uint64_t solve_count(const std::vector<Piece> &lib, Shape open) {
    auto mx = build_matrix(lib, open);
    auto dlx = mx.to_dlx();
    Search s{ dlx };
    s.run([](const std::vector<size_t> &) { return false; });
    return s.solutions();
}

std::vector<Solution> solve_parallel(const Board &board, const std::vector<Piece> &lib,
        Shape open, unsigned threads) {
    using rows_t = std::vector<std::vector<size_t>>;
    auto mx = build_matrix(lib, open);
    auto dlx = mx.to_dlx();
    auto c = dlx.choose_column();
    if (!c) // nothing to cover: the empty selection is the only cover
        return { decode(mx, {}, board.rows, board.cols) };

    boost::basic_thread_pool pool{ pool_size(threads) };
    std::vector<boost::future<rows_t>> branches;
    auto h = Dlx::header(*c);
    for (auto n = dlx.node(h).d; n != h; n = dlx.node(n).d)
        branches.push_back(boost::async(pool, [&dlx,n] {
            rows_t found;
            auto copy = dlx;
            Search s{ copy };
            s.select(n);
            s.run([&](const std::vector<size_t> &rows) {
                found.push_back(rows);
                return false;
            });
            return found;
        }));

    std::vector<Solution> solutions;
    std::exception_ptr failure;
    for (auto &f : branches) {
        try {
            for (auto &rows : f.get())
                solutions.push_back(decode(mx, rows, board.rows, board.cols));
        } catch (...) {
            if (!failure)
                failure = std::current_exception();
        }
    }
    pool.close();
    pool.join();
    if (failure)
        std::rethrow_exception(failure);
    return solutions;
}

void Sweeper::run_one(uint64_t i, Shape open) {
    auto t1 = std::chrono::steady_clock::now();
    auto cnt = solve_count(lib, open);
    auto t2 = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
    work_counter.fetch_add(cnt, std::memory_order_relaxed);
    after_run(i, open, cnt, ms);
    configs_counter.fetch_add(1, std::memory_order_relaxed);
}

void Sweeper::run1() {
    board.foreach([&,i=0ull](Shape open) mutable {
        if (should_run(i, open)) {
            run_one(i, open);
            configs_issue_counter++;
        }
        i++;
    });
}

void Sweeper::run(unsigned threads) {
    boost::basic_thread_pool pool{ pool_size(threads) };
    std::vector<boost::future<void>> tasks;
    board.foreach([&,i=0ull](Shape open) mutable {
        if (should_run(i, open)) {
            tasks.push_back(boost::async(pool, [this,i,open] {
                run_one(i, open);
            }));
            configs_issue_counter++;
        }
        i++;
    });
    std::exception_ptr failure;
    for (auto &t : tasks) {
        try {
            t.get();
        } catch (...) {
            if (!failure)
                failure = std::current_exception();
        }
    }
    pool.close();
    pool.join();
    if (failure)
        std::rethrow_exception(failure);
}

void Sweeper::after_run(uint64_t i, Shape open, uint64_t cnt, uint64_t ms) {
    if (!cnt) {
        fmt::print("########### ERROR: a board with ZERO cnt found\n{}#######################\n",
                open.to_string(board.rows, board.cols));
    }
}
