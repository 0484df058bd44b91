/**
 * @file  bench/bench_aggregation.cpp
 * @brief Google Benchmark suite for the per-request aggregations.
 *
 * Benchmarks
 * ----------
 *   BM_BillReduce            owner/period filter + 128-bit sums over all bills
 *   BM_SavingsReduce         goal totals and completion percentage
 *   BM_HealthSavingsScore    savings component of the health score
 *   BM_FullReport            engine end-to-end over in-memory collaborators
 *   BM_ParseBillsCsv         CSV fixture loading
 *
 * Build (CMake):
 *   cmake --build build --target bench_aggregation
 *   ./build/bench_aggregation --benchmark_format=json
 *
 * Throughput units: items/second (records processed).
 */

#include "benchmark/benchmark.h"

#include "finrep/bills.hpp"
#include "finrep/data_loader.hpp"
#include "finrep/engine.hpp"
#include "finrep/health_score.hpp"
#include "finrep/in_memory.hpp"
#include "finrep/savings.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

static const finrep::Identity OWNER{"alice"};
static const finrep::Identity OTHER{"bob"};

/// N bills, every third owned by someone else, every second paid,
/// creation times spread over [0, N).
static std::vector<finrep::Bill> make_bills(std::size_t n) {
    std::vector<finrep::Bill> bills(n);
    for (std::size_t i = 0; i < n; ++i) {
        bills[i].id         = static_cast<std::uint32_t>(i);
        bills[i].owner      = (i % 3 == 0) ? OTHER : OWNER;
        bills[i].amount     = static_cast<finrep::Amount>(100 + i);
        bills[i].paid       = (i % 2 == 0);
        bills[i].created_at = i;
        bills[i].due_date   = i + 30;
    }
    return bills;
}

static std::vector<finrep::SavingsGoal> make_goals(std::size_t n) {
    std::vector<finrep::SavingsGoal> goals(n);
    for (std::size_t i = 0; i < n; ++i) {
        goals[i].id             = static_cast<std::uint32_t>(i);
        goals[i].owner          = OWNER;
        goals[i].target_amount  = static_cast<finrep::Amount>(1'000 + i);
        goals[i].current_amount = static_cast<finrep::Amount>(i * 7 % 1'500);
    }
    return goals;
}

// ── Reducers ───────────────────────────────────────────────────────────────────

static void BM_BillReduce(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto bills = make_bills(n);
    for (auto _ : state) {
        auto r = finrep::BillComplianceCalculator::reduce(bills, OWNER, n / 4, 3 * n / 4, n / 2);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_BillReduce)->RangeMultiplier(4)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

static void BM_SavingsReduce(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto goals = make_goals(n);
    for (auto _ : state) {
        auto r = finrep::SavingsProgressCalculator::reduce(goals, 0, 0);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_SavingsReduce)->RangeMultiplier(4)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

static void BM_HealthSavingsScore(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto goals = make_goals(n);
    for (auto _ : state) {
        auto s = finrep::HealthScoreEngine::savings_score(goals);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_HealthSavingsScore)->RangeMultiplier(4)->Range(64, 65536)->Unit(benchmark::kMicrosecond);

// ── End to end ─────────────────────────────────────────────────────────────────

static void BM_FullReport(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));

    const finrep::Identity admin{"admin"};
    const finrep::CollaboratorAddresses addrs{
        .remittance_split = finrep::Identity{"split"},
        .savings_goals    = finrep::Identity{"goals"},
        .bill_payments    = finrep::Identity{"bills"},
        .insurance        = finrep::Identity{"insurance"},
        .family_wallet    = finrep::Identity{"family"},
    };

    finrep::InMemoryRemittanceSplit split({50, 30, 15, 5});
    finrep::InMemorySavingsGoals    goals(make_goals(n));
    finrep::InMemoryBillPayments    bills(make_bills(n));
    finrep::InMemoryInsurance       insurance;
    finrep::StaticDirectory         directory;
    directory.bind(addrs.remittance_split, split);
    directory.bind(addrs.savings_goals, goals);
    directory.bind(addrs.bill_payments, bills);
    directory.bind(addrs.insurance, insurance);

    finrep::ReportingState      rstate;
    finrep::InMemoryReportStore store;
    finrep::FixedClock          clock(n / 2);
    finrep::AllowListAuthorizer auth{admin};
    finrep::EventLog            events;
    finrep::core::ReportingEngine engine(
        finrep::core::ReportingContext{rstate, store, directory, clock, auth, events});
    engine.init(admin);
    engine.configure_addresses(admin, addrs);

    for (auto _ : state) {
        auto r = engine.get_financial_health_report(OWNER, 1'000'000, 0, n);
        benchmark::DoNotOptimize(r);
        events.clear();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_FullReport)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

// ── CSV loading ────────────────────────────────────────────────────────────────

static void BM_ParseBillsCsv(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    std::string csv = "id,owner,name,amount,due_date,recurring,frequency_days,paid,created_at,paid_at\n";
    for (std::size_t i = 0; i < n; ++i) {
        csv += fmt::format("{},alice,bill{},{},{},0,0,{},{},\n", i, i, 100 + i, i + 30, i % 2, i);
    }
    for (auto _ : state) {
        auto bills = finrep::core::DataLoader::parse_bills_csv(csv);
        benchmark::DoNotOptimize(bills.data());
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_ParseBillsCsv)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
