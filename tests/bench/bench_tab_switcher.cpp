#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include <vector>

#include "ui/switcher/fuzzy_matcher.hpp"
#include "ui/switcher/tab_match_list.hpp"
#include "ui/switcher/tab_switcher.hpp"
#include "workspace/document.hpp"
#include "workspace/workspace.hpp"

using namespace tabswitch;

namespace
{

// `panes` panes with `per_pane` tabs each. Every tenth file name repeats
// across directories so disambiguation has work to do.
void populate(Workspace& ws, int panes, int per_pane)
{
    for (int p = 0; p < panes; ++p)
    {
        auto& pane = ws.add_pane();
        for (int i = 0; i < per_pane; ++i)
        {
            std::string name = (i % 10 == 0) ? "mod.rs" : "file_" + std::to_string(i) + ".cpp";
            std::string path = "src/pane" + std::to_string(p) + "/dir" + std::to_string(i % 7) + "/" + name;
            pane.add_item(std::make_shared<Document>(path));
        }
    }
}

std::vector<TabMatch> candidates(int count)
{
    std::vector<TabMatch> out;
    out.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i)
    {
        TabMatch m;
        m.pane_id    = 1;
        m.item_index = static_cast<size_t>(i);
        m.item       = std::make_shared<Document>("lib/a" + std::to_string(i % 13) + "/b"
                                                  + std::to_string(i % 5) + "/main.cpp");
        out.push_back(std::move(m));
    }
    return out;
}

}   // namespace

// ─── Opening ─────────────────────────────────────────────────────────────────

static void BM_TabSwitcher_Open(benchmark::State& state)
{
    Workspace ws;
    populate(ws, 4, static_cast<int>(state.range(0)));
    DefaultFuzzyMatcher matcher;

    for (auto _ : state)
    {
        TabSwitcher sw(ws, matcher, PaneScope::AllPanes);
        benchmark::DoNotOptimize(sw.match_count());
        sw.dismiss();
    }
}
BENCHMARK(BM_TabSwitcher_Open)->Arg(10)->Arg(100)->Unit(benchmark::kMicrosecond);

// ─── Filtering ───────────────────────────────────────────────────────────────

static void BM_TabSwitcher_UpdateMatches(benchmark::State& state)
{
    Workspace ws;
    populate(ws, 4, static_cast<int>(state.range(0)));
    DefaultFuzzyMatcher matcher;
    TabSwitcher         sw(ws, matcher, PaneScope::AllPanes);

    const char* queries[] = {"f", "fi", "fil", "file_1", "mod", ""};
    size_t      q         = 0;
    for (auto _ : state)
    {
        sw.update_matches(queries[q++ % 6]);
        benchmark::DoNotOptimize(sw.match_count());
    }
    sw.dismiss();
}
BENCHMARK(BM_TabSwitcher_UpdateMatches)->Arg(10)->Arg(100)->Unit(benchmark::kMicrosecond);

static void BM_TabMatchList_ComputeDetails(benchmark::State& state)
{
    auto base = candidates(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        state.PauseTiming();
        auto matches = base;
        state.ResumeTiming();

        TabMatchList::compute_details(matches, 8);
        benchmark::DoNotOptimize(matches.data());
    }
}
BENCHMARK(BM_TabMatchList_ComputeDetails)->Arg(16)->Arg(256)->Unit(benchmark::kMicrosecond);

// ─── Preview ─────────────────────────────────────────────────────────────────

static void BM_TabSwitcher_CycleSelection(benchmark::State& state)
{
    Workspace ws;
    populate(ws, 4, 50);
    DefaultFuzzyMatcher matcher;
    TabSwitcher         sw(ws, matcher, PaneScope::AllPanes);

    for (auto _ : state)
    {
        sw.cycle_selection();
        benchmark::DoNotOptimize(sw.selected_index());
    }
    sw.dismiss();
}
BENCHMARK(BM_TabSwitcher_CycleSelection)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
