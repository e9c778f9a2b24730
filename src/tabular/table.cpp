#include "tabular/table.hpp"
#include "core/error.hpp"

#include <format>
#include <unordered_set>

namespace piishield {

std::optional<size_t> Table::column_index(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) return i;
    }
    return std::nullopt;
}

void Table::validate() const {
    std::unordered_set<std::string> seen;
    for (size_t c = 0; c < columns.size(); ++c) {
        if (columns[c].empty()) {
            throw MalformedInputError(std::format("Column #{} has an empty name", c));
        }
        if (!seen.insert(columns[c]).second) {
            throw MalformedInputError(std::format("Duplicate column name '{}'", columns[c]));
        }
    }
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != columns.size()) {
            throw MalformedInputError(std::format(
                "Row {} has {} cells, expected {}", r, rows[r].size(), columns.size()));
        }
    }
}

Table Table::from_records(std::vector<std::string> columns, const std::vector<Record>& records) {
    Table table;
    table.columns = std::move(columns);
    table.validate();

    table.rows.reserve(records.size());
    for (size_t r = 0; r < records.size(); ++r) {
        std::vector<CellValue> row(table.columns.size());
        for (const auto& [key, value] : records[r]) {
            const auto idx = table.column_index(key);
            if (!idx) {
                throw MalformedInputError(
                    std::format("Row {} has value for unknown column '{}'", r, key));
            }
            row[*idx] = value;
        }
        table.rows.emplace_back(std::move(row));
    }
    return table;
}

std::optional<std::string> cell_text(const CellValue& cell) {
    struct Visitor {
        std::optional<std::string> operator()(std::monostate) const { return std::nullopt; }
        std::optional<std::string> operator()(const std::string& s) const {
            if (s.empty()) return std::nullopt;
            return s;
        }
        std::optional<std::string> operator()(int64_t v) const { return std::format("{}", v); }
        std::optional<std::string> operator()(double v) const { return std::format("{}", v); }
        std::optional<std::string> operator()(bool v) const {
            return std::string(v ? "true" : "false");
        }
    };
    return std::visit(Visitor{}, cell);
}

} // namespace piishield
