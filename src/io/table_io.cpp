#include "io/table_io.hpp"
#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace piishield::io {

namespace {

struct CsvField {
    std::string text;
    bool quoted = false;
};

/**
 * @brief Split CSV content into records of fields (state machine, one pass)
 */
std::vector<std::vector<CsvField>> tokenize_csv(std::string_view content) {
    std::vector<std::vector<CsvField>> records;
    std::vector<CsvField> record;
    CsvField field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_field = [&] {
        record.emplace_back(std::move(field));
        field = CsvField{};
        field_started = false;
    };
    auto end_record = [&] {
        end_field();
        records.emplace_back(std::move(record));
        record.clear();
    };

    for (size_t i = 0; i < content.size(); ++i) {
        const char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field.text += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field.text += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                if (field_started) {
                    throw MalformedInputError(
                        std::format("CSV: unexpected quote inside unquoted field at byte {}", i));
                }
                in_quotes = true;
                field.quoted = true;
                field_started = true;
                break;
            case ',':
                end_field();
                break;
            case '\r':
                if (i + 1 < content.size() && content[i + 1] == '\n') ++i;
                end_record();
                break;
            case '\n':
                end_record();
                break;
            default:
                if (field.quoted) {
                    throw MalformedInputError(
                        std::format("CSV: data after closing quote at byte {}", i));
                }
                field.text += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        throw MalformedInputError("CSV: unterminated quoted field");
    }
    // Final record without trailing newline
    if (field_started || field.quoted || !record.empty()) {
        end_record();
    }
    return records;
}

bool needs_quoting(const std::string& s) {
    if (s.empty()) return false;
    if (s.front() == ' ' || s.back() == ' ') return true;
    return s.find_first_of(",\"\r\n") != std::string::npos;
}

std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string csv_cell(const CellValue& cell) {
    // Empty strings are quoted so they read back as strings, not nulls
    if (const auto* s = std::get_if<std::string>(&cell); s && s->empty()) {
        return "\"\"";
    }
    const auto text = cell_text(cell);
    if (!text) return "";
    return needs_quoting(*text) ? quote(*text) : *text;
}

CellValue from_json(const nlohmann::ordered_json& value, size_t row, const std::string& key) {
    switch (value.type()) {
        case nlohmann::ordered_json::value_t::null:
            return std::monostate{};
        case nlohmann::ordered_json::value_t::string:
            return value.get<std::string>();
        case nlohmann::ordered_json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::ordered_json::value_t::number_integer:
        case nlohmann::ordered_json::value_t::number_unsigned:
            return value.get<int64_t>();
        case nlohmann::ordered_json::value_t::number_float:
            return value.get<double>();
        default:
            throw MalformedInputError(std::format(
                "JSON: row {} key '{}' holds a nested {}; only flat records are supported",
                row, key, value.type_name()));
    }
}

nlohmann::ordered_json to_json(const CellValue& cell) {
    struct Visitor {
        nlohmann::ordered_json operator()(std::monostate) const { return nullptr; }
        nlohmann::ordered_json operator()(const std::string& s) const { return s; }
        nlohmann::ordered_json operator()(int64_t v) const { return v; }
        nlohmann::ordered_json operator()(double v) const { return v; }
        nlohmann::ordered_json operator()(bool v) const { return v; }
    };
    return std::visit(Visitor{}, cell);
}

} // anonymous namespace

Table parse_csv(std::string_view content) {
    auto records = tokenize_csv(content);
    if (records.empty()) {
        throw MalformedInputError("CSV: missing header row");
    }

    Table table;
    table.columns.reserve(records.front().size());
    for (auto& f : records.front()) {
        table.columns.emplace_back(std::move(f.text));
    }

    table.rows.reserve(records.size() - 1);
    for (size_t r = 1; r < records.size(); ++r) {
        auto& record = records[r];
        // Blank line: a single empty unquoted field
        if (record.size() == 1 && record[0].text.empty() && !record[0].quoted) {
            continue;
        }
        std::vector<CellValue> row;
        row.reserve(record.size());
        for (auto& f : record) {
            if (f.text.empty() && !f.quoted) {
                row.emplace_back(std::monostate{});
            } else {
                row.emplace_back(std::move(f.text));
            }
        }
        table.rows.emplace_back(std::move(row));
    }

    table.validate();
    return table;
}

std::string to_csv(const Table& table) {
    std::string out;
    for (size_t c = 0; c < table.columns.size(); ++c) {
        if (c > 0) out += ',';
        out += needs_quoting(table.columns[c]) ? quote(table.columns[c]) : table.columns[c];
    }
    out += '\n';

    for (const auto& row : table.rows) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) out += ',';
            out += csv_cell(row[c]);
        }
        out += '\n';
    }
    return out;
}

Table parse_json_records(std::string_view content) {
    nlohmann::ordered_json doc;
    try {
        doc = nlohmann::ordered_json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInputError(std::format("JSON: {}", e.what()));
    }
    if (!doc.is_array()) {
        throw MalformedInputError("JSON: expected an array of records");
    }

    std::vector<std::string> columns;
    std::vector<Record> records;
    records.reserve(doc.size());

    for (size_t r = 0; r < doc.size(); ++r) {
        const auto& obj = doc[r];
        if (!obj.is_object()) {
            throw MalformedInputError(std::format("JSON: element {} is not an object", r));
        }
        Record record;
        for (const auto& [key, value] : obj.items()) {
            if (std::find(columns.begin(), columns.end(), key) == columns.end()) {
                columns.push_back(key);
            }
            record.emplace(key, from_json(value, r, key));
        }
        records.emplace_back(std::move(record));
    }

    return Table::from_records(std::move(columns), records);
}

std::string to_json_records(const Table& table, int indent) {
    auto doc = nlohmann::ordered_json::array();
    for (const auto& row : table.rows) {
        nlohmann::ordered_json obj = nlohmann::ordered_json::object();
        for (size_t c = 0; c < table.columns.size() && c < row.size(); ++c) {
            obj[table.columns[c]] = to_json(row[c]);
        }
        doc.push_back(std::move(obj));
    }
    // Redacted cells may end in a partial multi-byte character
    return doc.dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error(std::format("Cannot open {}", path));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error(std::format("Failed reading {}", path));
    }
    return ss.str();
}

void write_file(const std::string& path, std::string_view content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error(std::format("Cannot open {} for writing", path));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!file) {
        throw std::runtime_error(std::format("Failed writing {}", path));
    }
}

} // namespace piishield::io
