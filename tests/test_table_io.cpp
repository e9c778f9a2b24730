#include <catch2/catch_test_macros.hpp>
#include "io/table_io.hpp"
#include "core/error.hpp"

#include <filesystem>

using namespace piishield;
using namespace std::string_literals;

// ============================================================================
// CSV
// ============================================================================

TEST_CASE("CSV: header and rows", "[io][csv]") {
    auto table = io::parse_csv("name,email\nAnn,ann@x.io\nBob,\n");

    CHECK(table.columns == std::vector<std::string>{"name", "email"});
    REQUIRE(table.row_count() == 2);
    CHECK(std::get<std::string>(table.rows[0][0]) == "Ann");
    CHECK(std::get<std::string>(table.rows[0][1]) == "ann@x.io");
    CHECK(std::holds_alternative<std::monostate>(table.rows[1][1]));
}

TEST_CASE("CSV: quoted fields", "[io][csv]") {
    auto table = io::parse_csv(
        "id,note\r\n"
        "1,\"Hello, \"\"world\"\"\"\r\n"
        "2,\"line one\nline two\"\r\n"
        "3,\"\"\r\n");

    REQUIRE(table.row_count() == 3);
    CHECK(std::get<std::string>(table.rows[0][1]) == "Hello, \"world\"");
    CHECK(std::get<std::string>(table.rows[1][1]) == "line one\nline two");
    // Quoted empty field stays an empty string
    CHECK(std::get<std::string>(table.rows[2][1]).empty());
}

TEST_CASE("CSV: values kept as exact strings", "[io][csv]") {
    auto table = io::parse_csv("zip,amount\n02134,1.50\n");
    CHECK(std::get<std::string>(table.rows[0][0]) == "02134");
    CHECK(std::get<std::string>(table.rows[0][1]) == "1.50");
}

TEST_CASE("CSV: blank lines and missing trailing newline", "[io][csv]") {
    auto table = io::parse_csv("a,b\n\n1,2\n\n3,4");
    REQUIRE(table.row_count() == 2);
    CHECK(std::get<std::string>(table.rows[1][1]) == "4");
}

TEST_CASE("CSV: malformed input", "[io][csv]") {
    CHECK_THROWS_AS(io::parse_csv(""), MalformedInputError);
    CHECK_THROWS_AS(io::parse_csv("a,b\n1,2,3\n"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_csv("a,b\n\"unterminated,2\n"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_csv("a,a\n1,2\n"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_csv("a,b\n\"x\"y,2\n"), MalformedInputError);
}

TEST_CASE("CSV: serialization quotes where needed", "[io][csv]") {
    Table table;
    table.columns = {"id", "note", "flag"};
    table.rows = {
        {int64_t{7}, "a, b"s, true},
        {CellValue{}, "say \"hi\""s, ""s},
    };

    CHECK(io::to_csv(table) ==
          "id,note,flag\n"
          "7,\"a, b\",true\n"
          ",\"say \"\"hi\"\"\",\"\"\n");
}

TEST_CASE("CSV: untouched cells round-trip", "[io][csv]") {
    const std::string csv = "name,email,zip\nAnn,[PII:EMAIL_ADDRESS],02134\n\"Lee, Jo\",,\"\"\n";
    CHECK(io::to_csv(io::parse_csv(csv)) == csv);
}

// ============================================================================
// JSON records
// ============================================================================

TEST_CASE("JSON: array of records", "[io][json]") {
    auto table = io::parse_json_records(R"([
        {"email": "a@x.com", "age": 31},
        {"email": "none", "vip": true, "score": 0.5},
        {"email": null}
    ])");

    CHECK(table.columns == std::vector<std::string>{"email", "age", "vip", "score"});
    REQUIRE(table.row_count() == 3);
    CHECK(std::get<int64_t>(table.rows[0][1]) == 31);
    CHECK(std::holds_alternative<std::monostate>(table.rows[0][2]));
    CHECK(std::get<bool>(table.rows[1][2]));
    CHECK(std::get<double>(table.rows[1][3]) == 0.5);
    CHECK(std::holds_alternative<std::monostate>(table.rows[2][0]));
}

TEST_CASE("JSON: malformed input", "[io][json]") {
    CHECK_THROWS_AS(io::parse_json_records("{not json"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_json_records(R"({"email": "a"})"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_json_records(R"([1, 2])"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_json_records(R"([{"a": {"b": 1}}])"), MalformedInputError);
    CHECK_THROWS_AS(io::parse_json_records(R"([{"a": [1]}])"), MalformedInputError);
}

TEST_CASE("JSON: serialization keeps column order and types", "[io][json]") {
    Table table;
    table.columns = {"z", "a"};
    table.rows = {{"[PII:PERSON]"s, int64_t{3}}, {CellValue{}, false}};

    CHECK(io::to_json_records(table, -1) ==
          R"([{"z":"[PII:PERSON]","a":3},{"z":null,"a":false}])");
}

TEST_CASE("JSON: invalid UTF-8 in a redacted cell still serializes", "[io][json]") {
    Table table;
    table.columns = {"dish"};
    table.rows = {{"[PII:X]\xA9"s}};   // trailing half of a split "é"

    std::string text;
    REQUIRE_NOTHROW(text = io::to_json_records(table, -1));
    CHECK(text == "[{\"dish\":\"[PII:X]\xEF\xBF\xBD\"}]");
}

// ============================================================================
// Files
// ============================================================================

TEST_CASE("Files: write then read", "[io]") {
    const auto path = (std::filesystem::temp_directory_path() / "pii_shield_io_test.txt").string();
    io::write_file(path, "hello\nworld");
    CHECK(io::read_file(path) == "hello\nworld");
    std::filesystem::remove(path);

    CHECK_THROWS_AS(io::read_file("/nonexistent/dir/file.txt"), std::runtime_error);
}
