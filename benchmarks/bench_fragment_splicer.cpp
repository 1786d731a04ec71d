// Splicer and page redaction microbenchmarks
// Measures paragraph splicing with heavily fragmented runs and incremental page redaction

#include "document/flow_document.h"
#include "document/memory_page.h"
#include "sanitizer/fragment_splicer.h"
#include "sanitizer/page_redaction_engine.h"
#include <benchmark/benchmark.h>
#include <string>
#include <vector>

using namespace docsan::document;
using namespace docsan::sanitizer;

namespace {

ReplacementSet makeSet(size_t entries) {
    std::vector<Replacement> out;
    for (size_t i = 0; i < entries; ++i) {
        out.push_back({"Employee Name " + std::to_string(i), "person",
                       "Person_" + std::to_string(i + 1)});
    }
    out.push_back({"IT", "department", "Dept_1"});
    return ReplacementSet(std::move(out));
}

// Paragraph whose text is cut into runs of `run_len` characters
Paragraph makeParagraph(size_t names, size_t run_len) {
    std::string text;
    for (size_t i = 0; i < names; ++i) {
        text += "Contact Employee Name " + std::to_string(i) + " in IT within the city. ";
    }
    Paragraph p;
    for (size_t pos = 0; pos < text.size(); pos += run_len) {
        p.addRun(text.substr(pos, run_len));
    }
    return p;
}

} // namespace

static void BM_SpliceFragmentedParagraph(benchmark::State& state) {
    size_t names = static_cast<size_t>(state.range(0));
    size_t run_len = static_cast<size_t>(state.range(1));
    FragmentSplicer splicer(makeSet(names));
    Paragraph original = makeParagraph(names, run_len);

    for (auto _ : state) {
        Paragraph p = original;
        auto result = splicer.splice(p);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(names));
}
BENCHMARK(BM_SpliceFragmentedParagraph)
    ->Args({4, 3})
    ->Args({16, 3})
    ->Args({16, 40})
    ->Args({64, 7});

static void BM_RedactPage(benchmark::State& state) {
    size_t lines = static_cast<size_t>(state.range(0));
    PageRedactionEngine engine(makeSet(lines));

    for (auto _ : state) {
        state.PauseTiming();
        MemoryPage page;
        for (size_t i = 0; i < lines; ++i) {
            GlyphSpan s;
            s.text = "Employee Name " + std::to_string(i) + " works in IT";
            page.addLine(72, 72 + 14.0 * static_cast<double>(i), {s});
        }
        SanitizeStats stats;
        state.ResumeTiming();

        benchmark::DoNotOptimize(engine.redactPage(page, stats));
    }
}
BENCHMARK(BM_RedactPage)->Arg(10)->Arg(50);

BENCHMARK_MAIN();
