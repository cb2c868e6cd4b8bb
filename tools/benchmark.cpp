// Snapshot strategy benchmark: compares NativeCopy, RawCopy and CompactCopy.
//
// Builds a scratch SQLite database with N rows (deleting every other row so
// there are free pages for CompactCopy to reclaim), then produces R snapshots
// with each strategy.
//
// Prints: runs, snapshot size, mean duration and percentiles (p50, p90, max)
// for each strategy.

#include "backup/snapshot_producer.hpp"
#include "backup/types.hpp"
#include "common/format.hpp"
#include "engine/sqlite_engine.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;
using steady = std::chrono::steady_clock;
using us     = std::chrono::microseconds;
using dbsnap::backup::SnapshotStrategy;

struct BenchResult {
    std::size_t runs = 0;
    std::uintmax_t size = 0;
    double avg_ms = 0;
    double p50_ms = 0;
    double p90_ms = 0;
    double max_ms = 0;
};

// ── Scratch database ─────────────────────────────────────────────────────────

bool exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        fprintf(stderr, "SQL error: %s\n", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool build_database(const fs::path& path, std::size_t rows) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        fprintf(stderr, "Cannot create %s\n", path.c_str());
        sqlite3_close(db);
        return false;
    }

    bool ok = exec(db, "CREATE TABLE items (id INTEGER PRIMARY KEY, payload TEXT)") &&
              exec(db, "BEGIN");

    sqlite3_stmt* stmt = nullptr;
    ok = ok && sqlite3_prepare_v2(db, "INSERT INTO items (payload) VALUES (?1)", -1,
                                  &stmt, nullptr) == SQLITE_OK;
    const std::string payload(200, 'x');
    for (std::size_t i = 0; ok && i < rows; ++i) {
        sqlite3_bind_text(stmt, 1, payload.c_str(), static_cast<int>(payload.size()),
                          SQLITE_STATIC);
        ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_reset(stmt);
    }
    sqlite3_finalize(stmt);

    ok = ok && exec(db, "COMMIT") && exec(db, "DELETE FROM items WHERE id % 2 = 0");
    sqlite3_close(db);
    return ok;
}

// ── Runner ───────────────────────────────────────────────────────────────────

BenchResult bench(dbsnap::backup::SnapshotProducer& producer, SnapshotStrategy strategy,
                  const fs::path& source, const fs::path& dir, std::size_t runs) {
    std::vector<int64_t> durations_us;
    durations_us.reserve(runs);

    BenchResult r;
    const auto target = dir / (std::string{dbsnap::backup::to_string(strategy)} + ".db");

    for (std::size_t i = 0; i < runs; ++i) {
        std::error_code rm_ec;
        fs::remove(target, rm_ec);

        auto t0 = steady::now();
        auto ec = producer.produce(strategy, source, target);
        auto t1 = steady::now();
        if (ec) {
            fprintf(stderr, "%s failed: %s\n",
                    std::string{dbsnap::backup::to_string(strategy)}.c_str(),
                    ec.message().c_str());
            return r;
        }
        durations_us.push_back(std::chrono::duration_cast<us>(t1 - t0).count());
    }

    std::sort(durations_us.begin(), durations_us.end());
    std::error_code ec;
    r.runs = durations_us.size();
    r.size = fs::file_size(target, ec);

    const auto total = std::accumulate(durations_us.begin(), durations_us.end(), int64_t{0});
    r.avg_ms = static_cast<double>(total) / static_cast<double>(r.runs) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(durations_us.size() - 1));
        return static_cast<double>(durations_us[idx]) / 1000.0;  // µs → ms
    };

    r.p50_ms = percentile(0.50);
    r.p90_ms = percentile(0.90);
    r.max_ms = static_cast<double>(durations_us.back()) / 1000.0;
    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Runs:         %zu\n"
        "  Size:         %s\n"
        "  Avg duration: %.2f ms\n"
        "  p50:          %.2f ms\n"
        "  p90:          %.2f ms\n"
        "  max:          %.2f ms\n",
        label, r.runs, dbsnap::format_size(r.size).c_str(),
        r.avg_ms, r.p50_ms, r.p90_ms, r.max_ms);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_rows = 50'000;
    std::size_t num_runs = 20;
    if (argc > 1) {
        num_rows = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_rows == 0) num_rows = 50'000;
    }
    if (argc > 2) {
        num_runs = static_cast<std::size_t>(std::atol(argv[2]));
        if (num_runs == 0) num_runs = 20;
    }

    const auto dir = fs::temp_directory_path() / "dbsnap_bench";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);
    if (ec) {
        fprintf(stderr, "Cannot create %s: %s\n", dir.c_str(), ec.message().c_str());
        return 1;
    }

    const auto source = dir / "source.db";
    if (!build_database(source, num_rows)) {
        return 1;
    }
    fs::create_directories(dir / "out", ec);

    fprintf(stdout,
        "Snapshot Strategy Benchmark\n"
        "===========================\n"
        "Rows:     %zu (half deleted)\n"
        "Runs:     %zu per strategy\n"
        "Source:   %s (%s)\n",
        num_rows, num_runs, source.c_str(),
        dbsnap::format_size(fs::file_size(source, ec)).c_str());

    dbsnap::engine::SqliteEngine engine;
    dbsnap::backup::SnapshotProducer producer{engine};

    print_result("NativeCopy (backup)",
                 bench(producer, SnapshotStrategy::NativeCopy, source, dir / "out", num_runs));
    print_result("RawCopy (copy)",
                 bench(producer, SnapshotStrategy::RawCopy, source, dir / "out", num_runs));
    print_result("CompactCopy (vacuum)",
                 bench(producer, SnapshotStrategy::CompactCopy, source, dir / "out", num_runs));

    fprintf(stdout, "\n");
    fs::remove_all(dir, ec);
    return 0;
}
