#pragma once

#include "core/types.hpp"
#include "analyzer/analyzer.hpp"
#include "redactor/redactor.hpp"
#include "tabular/table.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace piishield {

struct TabularOptions {
    // Tables with at least this many rows are split across workers
    size_t parallel_threshold = 1000;
    unsigned max_workers = 4;
};

struct TextAnalysis {
    std::vector<Finding> findings;
    std::string sanitized;
    std::vector<RecognizerFailure> warnings;
};

struct TableAnalysis {
    std::vector<Finding> findings;      // column order, then row, then start
    Table sanitized;
    std::vector<RecognizerFailure> warnings;
};

/**
 * @brief Tabular Adapter - Analyzer + Redactor applied per cell
 *
 * Every non-empty cell is an independent text unit analyzed against one
 * registry snapshot taken for the whole table. Null and empty cells are
 * skipped. Only cells with at least one retained span change (they become
 * strings); shape, column order and all other values are preserved.
 *
 * Recognizer warnings are aggregated across cells, one per recognizer and
 * failure kind.
 */
class TabularAdapter {
public:
    TabularAdapter(const Analyzer& analyzer, const Redactor& redactor,
                   TabularOptions options = {});

    /**
     * @throws MalformedInputError on ragged rows or invalid header (no partial output)
     */
    [[nodiscard]] TableAnalysis analyze_table(const Table& table) const;

    /**
     * @brief Single-document counterpart: findings carry no unit id
     */
    [[nodiscard]] TextAnalysis analyze_text(std::string_view text) const;

private:
    struct CellResult {
        std::vector<Span> spans;
        std::optional<std::string> sanitized;
        std::vector<RecognizerFailure> warnings;
    };

    [[nodiscard]] CellResult process_cell(const CellValue& cell,
                                          const RegistrySnapshot& snapshot) const;

    const Analyzer& analyzer_;
    const Redactor& redactor_;
    TabularOptions options_;
};

/**
 * @brief Build one finding per span; excerpt is the span's slice of text
 */
[[nodiscard]] std::vector<Finding> make_findings(std::string_view text,
                                                 const std::vector<Span>& spans,
                                                 const std::optional<UnitId>& unit = std::nullopt);

/**
 * @brief Keep the first warning per (recognizer, kind)
 */
void merge_warnings(std::vector<RecognizerFailure>& into,
                    const std::vector<RecognizerFailure>& from);

} // namespace piishield
