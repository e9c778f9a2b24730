#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace piishield {

// null | string | integer | float | boolean
using CellValue = std::variant<std::monostate, std::string, int64_t, double, bool>;

using Record = std::unordered_map<std::string, CellValue>;

/**
 * @brief Rectangular table: ordered column names plus rows of raw values
 *
 * rows[r][c] belongs to columns[c]. Use validate() (or from_records()) before
 * handing a table to the engine.
 */
struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<CellValue>> rows;

    [[nodiscard]] size_t column_count() const { return columns.size(); }
    [[nodiscard]] size_t row_count() const { return rows.size(); }

    [[nodiscard]] std::optional<size_t> column_index(const std::string& name) const;

    /**
     * @brief Shape checks: non-empty unique column names, every row as wide as the header
     * @throws MalformedInputError
     */
    void validate() const;

    /**
     * @brief Build a table from column names and name -> value records
     *
     * Missing keys become null cells.
     * @throws MalformedInputError on keys outside columns or an invalid header
     */
    [[nodiscard]] static Table from_records(std::vector<std::string> columns,
                                            const std::vector<Record>& records);

    bool operator==(const Table&) const = default;
};

/**
 * @brief Text of a cell as analyzed: nullopt for null and empty strings
 *
 * Integers print in decimal, floats in shortest round-trip form,
 * booleans as "true"/"false".
 */
[[nodiscard]] std::optional<std::string> cell_text(const CellValue& cell);

} // namespace piishield
