#pragma once

#include "tabular/table.hpp"
#include <string>
#include <string_view>

namespace piishield::io {

/**
 * @brief Parse RFC 4180 CSV with a header row
 *
 * Quoted fields may contain separators, doubled quotes and line breaks.
 * Unquoted empty fields become null cells; every other field is kept as the
 * exact string read, so unchanged cells round-trip byte for byte.
 * @throws MalformedInputError on unterminated quotes or ragged rows
 */
[[nodiscard]] Table parse_csv(std::string_view content);

/**
 * @brief Serialize a table as CSV (header + rows, '\n' line endings)
 *
 * Null cells are written empty; fields containing separators, quotes,
 * line breaks or edge whitespace are quoted.
 */
[[nodiscard]] std::string to_csv(const Table& table);

/**
 * @brief Parse a JSON array of flat objects (one object per row)
 *
 * Columns appear in order of first appearance; keys missing from a row are
 * null. Values must be strings, numbers, booleans or null.
 * @throws MalformedInputError on invalid JSON or nested values
 */
[[nodiscard]] Table parse_json_records(std::string_view content);

/**
 * @brief Serialize a table as a JSON array of objects in column order
 */
[[nodiscard]] std::string to_json_records(const Table& table, int indent = 2);

/**
 * @brief Read a whole file
 * @throws std::runtime_error when the file cannot be read
 */
[[nodiscard]] std::string read_file(const std::string& path);

/**
 * @brief Write a whole file, replacing existing content
 * @throws std::runtime_error on I/O failure
 */
void write_file(const std::string& path, std::string_view content);

} // namespace piishield::io
