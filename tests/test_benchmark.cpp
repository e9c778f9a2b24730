#include <benchmark/benchmark.h>

#include "analyzer/span_resolver.hpp"
#include "core/engine.hpp"
#include "redactor/redactor.hpp"

#include <format>
#include <memory>
#include <string>
#include <vector>

using namespace piishield;

// ============================================================================
// Helpers
// ============================================================================

namespace {

const std::string kShortText = "Contact alice@example.com";
const std::string kMixedText =
    "Student school123 (ssn 123-45-6789) wrote from 10.0.0.7 to dean@uni.edu; "
    "card 4111-1111-1111-1111, phone 555-123-4567, web www.uni.edu/admissions";
const std::string kCleanText =
    "The committee reviewed the quarterly figures and approved the budget "
    "for the next fiscal year without further amendments.";

std::unique_ptr<PiiShield> make_engine() {
    auto engine = std::make_unique<PiiShield>();
    engine->add_whitelist_rule("SCHOOL_ID", {"223j1ao5g", "school123", "student456"});
    engine->add_regex_rule("EMPLOYEE_ID", R"(\bEMP-[0-9]{6}\b)");
    return engine;
}

Table make_table(size_t rows) {
    Table table;
    table.columns = {"id", "name", "contact", "note"};
    table.rows.reserve(rows);
    for (size_t i = 0; i < rows; ++i) {
        table.rows.push_back({
            CellValue{static_cast<int64_t>(i)},
            CellValue{std::format("user{}", i)},
            CellValue{i % 2 == 0 ? std::format("u{}@corp.io", i) : std::string("n/a")},
            CellValue{std::string("call 555-123-4567 after 5pm")},
        });
    }
    return table;
}

} // anonymous namespace

// ============================================================================
// Analyzer
// ============================================================================

static void BM_Analyze_Short(benchmark::State& state) {
    auto engine = make_engine();
    for (auto _ : state) {
        auto result = engine->analyze(kShortText);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Analyze_Short);

static void BM_Analyze_Mixed(benchmark::State& state) {
    auto engine = make_engine();
    for (auto _ : state) {
        auto result = engine->analyze(kMixedText);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Analyze_Mixed);

static void BM_Analyze_Clean(benchmark::State& state) {
    auto engine = make_engine();
    for (auto _ : state) {
        auto result = engine->analyze(kCleanText);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Analyze_Clean);

static void BM_Analyze_Throughput(benchmark::State& state) {
    static auto engine = make_engine();
    for (auto _ : state) {
        auto result = engine->analyze(kMixedText);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Analyze_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

// ============================================================================
// Conflict resolution
// ============================================================================

static void BM_ResolveConflicts_SpanCount(benchmark::State& state) {
    std::vector<Span> spans;
    const auto n = static_cast<size_t>(state.range(0));
    for (size_t i = 0; i < n; ++i) {
        const size_t start = (i * 7) % (n * 3 + 1);
        spans.emplace_back("T", start, start + 5 + (i % 11), 0.3 + 0.01 * static_cast<double>(i % 60));
    }
    for (auto _ : state) {
        auto result = resolve_conflicts(spans);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ResolveConflicts_SpanCount)->Arg(10)->Arg(100)->Arg(1000);

// ============================================================================
// Redactor
// ============================================================================

static void BM_Redact_Mixed(benchmark::State& state) {
    auto engine = make_engine();
    const auto spans = engine->analyze(kMixedText).spans;
    Redactor redactor;
    for (auto _ : state) {
        auto out = redactor.redact(kMixedText, spans);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Redact_Mixed);

static void BM_Redact_Hash(benchmark::State& state) {
    auto engine = make_engine();
    const auto spans = engine->analyze(kMixedText).spans;
    RedactorOptions options;
    options.default_action = RedactionAction::HASH;
    Redactor redactor(options);
    for (auto _ : state) {
        auto out = redactor.redact(kMixedText, spans);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Redact_Hash);

// ============================================================================
// Tabular
// ============================================================================

static void BM_AnalyzeTable_RowCount(benchmark::State& state) {
    auto engine = make_engine();
    const auto table = make_table(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto result = engine->analyze_table(table);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_AnalyzeTable_RowCount)->Arg(10)->Arg(100)->Arg(2000);
