#include <benchmark/benchmark.h>
#include "../tests/support/Harness.hpp"
#include "reclaim/cleanup/TaskStore.hpp"
#include "reclaim/store/MemDatabase.hpp"
#include "reclaim/util/Logger.hpp"
#include <string>

using namespace reclaim;
using namespace reclaim::cleanup;

namespace {

void quietLogs() {
    util::logger().setLevel(util::LogLevel::Error);
}

} // namespace

// Enqueue plus a full drain of settings cleanups, the cheapest handler, so
// the numbers mostly reflect store and dispatch overhead.
static void BM_DrainSettings(benchmark::State& state) {
    quietLogs();
    const auto n = static_cast<int>(state.range(0));

    for (auto _ : state) {
        state.PauseTiming();
        fake::Harness h;
        for (int i = 0; i < n; ++i) {
            const std::string prefix = "r#" + std::to_string(i) + "#";
            h.world.relationSettings.insert(prefix + "a");
            if (!h.cleaner.enqueueCleanup(CleanupKind::RelationSettings, prefix)) {
                state.SkipWithError("enqueue failed");
                return;
            }
        }
        state.ResumeTiming();

        CleanupReport report;
        Status st = h.cleaner.runCleanup(&report);
        benchmark::DoNotOptimize(st);
        benchmark::DoNotOptimize(report.succeeded);
    }
    state.SetItemsProcessed(state.iterations() * n);
}

BENCHMARK(BM_DrainSettings)->Arg(16)->Arg(256)->Arg(1024)->Unit(benchmark::kMicrosecond);

static void BM_EnqueueCleanup(benchmark::State& state) {
    quietLogs();
    store::MemDatabase db;
    TaskStore tasks(db);

    int i = 0;
    for (auto _ : state) {
        Status st = tasks.enqueue(CleanupKind::DyingUnit, "myapp/" + std::to_string(i++),
                                  encodeArgs(UnitDestroyArgs{true, false}));
        benchmark::DoNotOptimize(st);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_EnqueueCleanup)->Unit(benchmark::kMicrosecond);

static void BM_DecodeTask(benchmark::State& state) {
    store::Document raw{"5f2b3c4d0123456789abcdef",
                        R"({"_id":"5f2b3c4d0123456789abcdef","kind":"dyingUnit","when":0,"prefix":"myapp/0","args":[true,false]})"};
    for (auto _ : state) {
        auto doc = decodeCleanupDoc(raw);
        auto task = decodeTask(*doc);
        benchmark::DoNotOptimize(task);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_DecodeTask);

BENCHMARK_MAIN();
