#include <catch2/catch_test_macros.hpp>
#include "core/engine.hpp"
#include "core/error.hpp"
#include "analyzer/span_resolver.hpp"

#include <atomic>
#include <format>
#include <thread>

using namespace piishield;
using namespace std::string_literals;

TEST_CASE("Engine: whitelist rule end to end", "[engine]") {
    PiiShield engine;
    engine.add_whitelist_rule("SCHOOL_ID", {"223j1ao5g", "school123", "student456"});

    const std::string text = "id: 223j1ao5g end";
    auto result = engine.analyze(text);
    REQUIRE(result.spans.size() == 1);
    CHECK(result.spans[0].type == "SCHOOL_ID");
    CHECK(result.spans[0].start == 4);
    CHECK(result.spans[0].end == 13);

    CHECK(engine.redact(text, result.spans) == "id: [PII:SCHOOL_ID] end");
}

TEST_CASE("Engine: regex rule end to end", "[engine]") {
    PiiShield engine;
    engine.add_regex_rule("EMPLOYEE_ID", R"(\bEMP-[0-9]{6}\b)", 0.9);

    auto result = engine.analyze_text("Badge EMP-004211, mail hr@corp.example");
    REQUIRE(result.findings.size() == 2);
    CHECK(result.findings[0].type == "EMPLOYEE_ID");
    CHECK(result.findings[0].excerpt == "EMP-004211");
    CHECK(result.findings[1].type == "EMAIL_ADDRESS");
    CHECK(result.sanitized == "Badge [PII:EMPLOYEE_ID], mail [PII:EMAIL_ADDRESS]");
}

TEST_CASE("Engine: invalid rule leaves the engine unchanged", "[engine]") {
    PiiShield engine;
    const auto before = engine.registry().size();

    CHECK_THROWS_AS(engine.add_regex_rule("BROKEN", "(unclosed"), InvalidRuleError);
    CHECK_THROWS_AS(engine.add_whitelist_rule("", {"x"}), InvalidRuleError);
    CHECK_THROWS_AS(engine.add_whitelist_rule("EMPTY", {}), InvalidRuleError);
    CHECK_THROWS_AS(engine.add_regex_rule("CreditCardRecognizer", "x"), InvalidRuleError);

    CHECK(engine.registry().size() == before);
}

TEST_CASE("Engine: redaction properties", "[engine]") {
    PiiShield engine;
    engine.add_whitelist_rule("SCHOOL_ID", {"school123"});

    const std::string text =
        "Student school123 (ssn 123-45-6789) wrote from 10.0.0.7 to dean@uni.edu; "
        "card 4111-1111-1111-1111, web www.uni.edu/admissions";

    auto result = engine.analyze(text);
    REQUIRE(result.spans.size() == 6);
    REQUIRE(is_canonical(result.spans));

    const auto sanitized = engine.redact(text, result.spans);

    // Bytes outside spans are copied verbatim, in order
    size_t in = 0;
    size_t out = 0;
    for (const auto& span : result.spans) {
        const auto gap = text.substr(in, span.start - in);
        CHECK(sanitized.substr(out, gap.size()) == gap);
        out += gap.size();
        const auto tag = Redactor::placeholder(span.type);
        CHECK(sanitized.substr(out, tag.size()) == tag);
        out += tag.size();
        in = span.end;
    }
    CHECK(sanitized.substr(out) == text.substr(in));

    // Deterministic
    CHECK(engine.redact(text, engine.analyze(text).spans) == sanitized);
}

TEST_CASE("Engine: empty input round-trips", "[engine]") {
    PiiShield engine;
    auto result = engine.analyze("");
    CHECK(result.spans.empty());
    CHECK(engine.redact("", result.spans).empty());
}

TEST_CASE("Engine: text without PII is unchanged", "[engine]") {
    PiiShield engine;
    const std::string text = "The quarterly report is attached.";
    auto result = engine.analyze_text(text);
    CHECK(result.findings.empty());
    CHECK(result.sanitized == text);
}

TEST_CASE("Engine: configured redaction actions", "[engine]") {
    EngineConfig config;
    config.redactor.actions["CREDIT_CARD"] = RedactionAction::MASK;
    PiiShield engine(config);
    CHECK(engine.config().redactor.actions.size() == 1);

    auto result = engine.analyze_text("pay 4111111111111111 now");
    CHECK(result.sanitized == "pay **************** now");
}

TEST_CASE("Engine: table analysis with a custom rule", "[engine]") {
    PiiShield engine;
    engine.add_whitelist_rule("SCHOOL_ID", {"223j1ao5g"});

    auto table = Table::from_records({"student", "contact"}, {
        Record{{"student", "223j1ao5g"s}, {"contact", "a@x.com"s}},
        Record{{"student", "unknown"s}},
    });

    auto result = engine.analyze_table(table);
    REQUIRE(result.findings.size() == 2);
    CHECK(result.findings[0].unit == UnitId{"student", 0});
    CHECK(result.findings[0].type == "SCHOOL_ID");
    CHECK(result.findings[1].unit == UnitId{"contact", 0});

    CHECK(std::get<std::string>(result.sanitized.rows[0][0]) == "[PII:SCHOOL_ID]");
    CHECK(std::get<std::string>(result.sanitized.rows[1][0]) == "unknown");
    CHECK(std::holds_alternative<std::monostate>(result.sanitized.rows[1][1]));
}

TEST_CASE("Engine: rules added during analysis never tear a pass", "[engine]") {
    PiiShield engine;
    const std::string text = "tag1 tag2 tag3 tag4 tag5 tag6 tag7 tag8";

    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::thread analyzer([&] {
        while (!done.load()) {
            auto result = engine.analyze(text);
            if (!is_canonical(result.spans) || result.degraded()) {
                ++bad;
            }
        }
    });

    for (int i = 1; i <= 8; ++i) {
        engine.add_whitelist_rule(std::format("TAG_{}", i), {std::format("tag{}", i)});
    }
    done = true;
    analyzer.join();

    CHECK(bad.load() == 0);
    CHECK(engine.analyze(text).spans.size() == 8);
}
