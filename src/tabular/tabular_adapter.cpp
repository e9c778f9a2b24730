#include "tabular/tabular_adapter.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <iterator>
#include <thread>

namespace piishield {

std::vector<Finding> make_findings(std::string_view text,
                                   const std::vector<Span>& spans,
                                   const std::optional<UnitId>& unit) {
    std::vector<Finding> findings;
    findings.reserve(spans.size());
    for (const auto& span : spans) {
        Finding f;
        f.unit = unit;
        f.type = span.type;
        f.excerpt = std::string(text.substr(span.start, span.length()));
        f.score = span.score;
        f.start = span.start;
        f.end = span.end;
        f.recognizer = span.recognizer;
        findings.emplace_back(std::move(f));
    }
    return findings;
}

void merge_warnings(std::vector<RecognizerFailure>& into,
                    const std::vector<RecognizerFailure>& from) {
    for (const auto& w : from) {
        const bool known = std::any_of(into.begin(), into.end(), [&](const RecognizerFailure& e) {
            return e.recognizer == w.recognizer && e.kind == w.kind;
        });
        if (!known) {
            into.push_back(w);
        }
    }
}

TabularAdapter::TabularAdapter(const Analyzer& analyzer, const Redactor& redactor,
                               TabularOptions options)
    : analyzer_(analyzer), redactor_(redactor), options_(options) {}

TextAnalysis TabularAdapter::analyze_text(std::string_view text) const {
    auto analysis = analyzer_.analyze(text);

    TextAnalysis result;
    result.sanitized = redactor_.redact(text, analysis.spans);
    result.findings = make_findings(text, analysis.spans);
    result.warnings = std::move(analysis.warnings);
    return result;
}

TabularAdapter::CellResult TabularAdapter::process_cell(const CellValue& cell,
                                                        const RegistrySnapshot& snapshot) const {
    CellResult result;
    const auto text = cell_text(cell);
    if (!text) {
        return result;
    }

    auto analysis = analyzer_.analyze(*text, snapshot);
    result.warnings = std::move(analysis.warnings);
    if (analysis.spans.empty()) {
        return result;
    }

    result.sanitized = redactor_.redact(*text, analysis.spans);
    result.spans = std::move(analysis.spans);
    return result;
}

TableAnalysis TabularAdapter::analyze_table(const Table& table) const {
    table.validate();

    const size_t num_rows = table.row_count();
    const size_t num_cols = table.column_count();

    // One snapshot for the whole table: every cell sees the same rule set
    const auto snapshot = analyzer_.registry().snapshot();

    // results[r * num_cols + c]; each worker writes a disjoint row range
    std::vector<CellResult> results(num_rows * num_cols);

    auto process_range = [&](size_t start, size_t end) {
        for (size_t r = start; r < end; ++r) {
            for (size_t c = 0; c < num_cols; ++c) {
                results[r * num_cols + c] = process_cell(table.rows[r][c], snapshot);
            }
        }
    };

    const unsigned hw_threads = std::thread::hardware_concurrency();
    if (num_rows >= options_.parallel_threshold && hw_threads > 1 && options_.max_workers > 1) {
        const unsigned num_workers = std::min(hw_threads, options_.max_workers);
        const size_t chunk = (num_rows + num_workers - 1) / num_workers;

        std::vector<std::future<void>> futures;
        futures.reserve(num_workers);

        for (unsigned w = 0; w < num_workers; ++w) {
            const size_t start = w * chunk;
            const size_t end = std::min(start + chunk, num_rows);
            if (start >= end) break;
            futures.push_back(std::async(std::launch::async, process_range, start, end));
        }
        for (auto& f : futures) f.get();
    } else {
        process_range(0, num_rows);
    }

    TableAnalysis analysis;
    analysis.sanitized = table;

    for (size_t c = 0; c < num_cols; ++c) {
        for (size_t r = 0; r < num_rows; ++r) {
            auto& cell = results[r * num_cols + c];
            merge_warnings(analysis.warnings, cell.warnings);
            if (!cell.sanitized) continue;

            const auto text = cell_text(table.rows[r][c]);
            auto findings = make_findings(*text, cell.spans, UnitId{table.columns[c], r});
            analysis.findings.insert(analysis.findings.end(),
                                     std::make_move_iterator(findings.begin()),
                                     std::make_move_iterator(findings.end()));
            analysis.sanitized.rows[r][c] = std::move(*cell.sanitized);
        }
    }

    utils::log::debug(std::format("Table {}x{}: {} finding(s), {} warning(s)",
        num_rows, num_cols, analysis.findings.size(), analysis.warnings.size()));
    return analysis;
}

} // namespace piishield
