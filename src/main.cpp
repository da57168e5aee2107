#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <limits>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#ifdef HAS_MIMALLOC
#include <mimalloc-new-delete.h>
#endif

#include <fmt/format.h>

#include "catalog.hpp"
#include "error.hpp"
#include "naive.hpp"
#include "solver.hpp"
#include "util.hpp"

namespace {

using namespace std::string_literals;

constexpr unsigned max_threads = 1024;

struct SweepReport : Sweeper {
    std::atomic<uint64_t> min{ std::numeric_limits<uint64_t>::max() }, max{}, zero{};

    using Sweeper::Sweeper;

protected:
    void after_run(uint64_t i, Shape open, uint64_t cnt, uint64_t ms) override {
        Sweeper::after_run(i, open, cnt, ms);
        if (!cnt)
            zero.fetch_add(1, std::memory_order_relaxed);
        for (auto v = min.load(); cnt < v && !min.compare_exchange_weak(v, cnt););
        for (auto v = max.load(); cnt > v && !max.compare_exchange_weak(v, cnt););
    }
};

std::jthread monitor(const Sweeper &sw, uint64_t bmax) {
    using namespace std::chrono_literals;
    return std::jthread{ [&sw,bmax](std::stop_token st) {
        auto old = 0ull;
        while (!st.stop_requested()) {
            std::this_thread::sleep_for(1s);
            auto next = sw.work_done();
            fmt::print("{}/{} board done, {} solutions found ({}/s)\n",
                    sw.configs_done(), bmax, display(next), display(next - old));
            old = next;
        }
    } };
}

double seconds_since(std::chrono::steady_clock::time_point t1) {
    auto t2 = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(t2 - t1).count();
}

int usage(const char *argv0) {
    fmt::print(stderr,
            "usage: {} [MONTH DAY [WEEKDAY]]\n"
            "  WEEKDAY: 1=Sunday ... 7=Saturday, selects the weekday board\n"
            "  env BOARD=<file>  board art, one region letter per date field\n"
            "  env PIECES=<file> one 'name path' per line, e.g. 'T R,R,U,DD'\n"
            "  env S=first|all|count|naive|sweep (default first)\n"
            "  env T=<threads>   1..{} for all and sweep\n", argv0, max_threads);
    return 1;
}

int run(int argc, char *argv[]) {
    std::vector<size_t> picks;
    if (argc == 1) {
        auto now = std::time(nullptr);
        auto tm = *std::localtime(&now);
        picks = { size_t(tm.tm_mon + 1), size_t(tm.tm_mday) };
    } else if (argc == 3 || argc == 4) {
        for (auto i = 1; i < argc; i++) {
            auto v = parse_uint(argv[i], 1, 64);
            if (!v)
                return usage(argv[0]);
            picks.push_back(*v);
        }
    } else {
        return usage(argv[0]);
    }

    auto mode = ::getenv("S") && *::getenv("S") ? std::string{ ::getenv("S") } : "first"s;
    if (mode != "first" && mode != "all" && mode != "count" && mode != "naive" && mode != "sweep") {
        fmt::print(stderr, "error: unknown mode S={}\n", mode);
        return usage(argv[0]);
    }
    auto threads = 0u;
    if (::getenv("T") && *::getenv("T")) {
        auto t = parse_uint(::getenv("T"), 1, max_threads);
        if (!t) {
            fmt::print(stderr, "error: T={} is not a thread count in 1..{}\n", ::getenv("T"), max_threads);
            return usage(argv[0]);
        }
        threads = *t;
    }

    auto weekday = picks.size() == 3;
    auto board = ::getenv("BOARD") && *::getenv("BOARD")
        ? Board::from_file(::getenv("BOARD"))
        : weekday ? weekday_board() : classic_board();
    auto lib = ::getenv("PIECES") && *::getenv("PIECES")
        ? load_pieces(::getenv("PIECES"))
        : board.regions.size() == 3 ? weekday_pieces() : classic_pieces();

    auto cells = 0zu;
    for (auto &p : lib)
        cells += p.size();
    fmt::print("working on a {}x{} board of size={} regions={} configs={}, {} pieces of {} cells\n",
            board.rows, board.cols, board.base.size(), board.regions.size(), board.count,
            lib.size(), cells);

    if (mode == "sweep") {
        SweepReport sw{ board, lib };
        auto t1 = std::chrono::steady_clock::now();
        {
            auto j = monitor(sw, board.count);
            sw.run(threads);
        }
        fmt::print("{} configs in {}: min={} max={} zero={} total={}\n",
                sw.configs_done(), display(seconds_since(t1)),
                sw.min.load(), sw.max.load(), sw.zero.load(), sw.work_done());
        return sw.zero.load() ? 2 : 0;
    }

    auto excluded = board.date(picks);
    auto open = board.open(excluded);
    fmt::print("date {}", picks[0]);
    for (auto i = 1zu; i < picks.size(); i++)
        fmt::print("/{}", picks[i]);
    fmt::print(" excludes");
    for (auto [y, x] : excluded)
        fmt::print(" ({},{})", y, x);
    fmt::print("\n");
    if (open.size() != cells)
        fmt::print(stderr, "warning: {} open cells but the pieces cover {}\n", open.size(), cells);

    auto t1 = std::chrono::steady_clock::now();
    std::vector<Solution> solutions;
    if (mode == "first") {
        SolveStats stats{};
        solutions = solve(board, lib, open, true, &stats);
        fmt::print("matrix of {} columns x {} rows, {} nodes searched in {}\n",
                stats.columns, stats.rows, display(stats.nodes), display(seconds_since(t1)));
    } else if (mode == "all") {
        solutions = solve_parallel(board, lib, open, threads);
        fmt::print("{} solutions in {}\n", solutions.size(), display(seconds_since(t1)));
    } else if (mode == "count") {
        auto cnt = solve_count(lib, open);
        fmt::print("{} solutions in {}\n", cnt, display(seconds_since(t1)));
        return cnt ? 0 : 2;
    } else {
        solutions = solve_naive(board, lib, open, true);
        fmt::print("naive search done in {}\n", display(seconds_since(t1)));
    }

    if (solutions.empty()) {
        fmt::print("no solution\n");
        return 2;
    }
    for (auto &sol : solutions)
        fmt::print("{}\n", sol.to_string(lib));
    return 0;
}

}

int main(int argc, char *argv[]) {
    try {
        return run(argc, argv);
    } catch (const MalformedSolution &e) {
        fmt::print(stderr, "error: internal: {}\n", e.what());
        return 3;
    } catch (const InvalidPieceShape &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    } catch (const InvalidExcludedCell &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    } catch (const std::exception &e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
