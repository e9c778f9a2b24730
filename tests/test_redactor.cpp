#include <catch2/catch_test_macros.hpp>
#include "redactor/redactor.hpp"
#include "core/error.hpp"

using namespace piishield;

// ============================================================================
// REPLACE (default)
// ============================================================================

TEST_CASE("Redactor: placeholder format", "[redactor]") {
    CHECK(Redactor::placeholder("EMAIL_ADDRESS") == "[PII:EMAIL_ADDRESS]");
    CHECK(Redactor::placeholder("SCHOOL_ID") == "[PII:SCHOOL_ID]");
}

TEST_CASE("Redactor: spans replaced, everything else untouched", "[redactor]") {
    Redactor redactor;
    const std::string text = "Mail alice@example.com or call 555-123-4567.";
    std::vector<Span> spans = {
        {"EMAIL_ADDRESS", 5, 22, 1.0},
        {"PHONE_NUMBER", 31, 43, 0.75},
    };

    CHECK(redactor.redact(text, spans) ==
          "Mail [PII:EMAIL_ADDRESS] or call [PII:PHONE_NUMBER].");
}

TEST_CASE("Redactor: spans at both edges and adjacent spans", "[redactor]") {
    Redactor redactor;
    CHECK(redactor.redact("abcdef", {{"X", 0, 2, 1.0}, {"Y", 2, 4, 1.0}, {"Z", 4, 6, 1.0}}) ==
          "[PII:X][PII:Y][PII:Z]");
    CHECK(redactor.redact("abcdef", {{"X", 0, 6, 1.0}}) == "[PII:X]");
}

TEST_CASE("Redactor: no spans returns the input", "[redactor]") {
    Redactor redactor;
    CHECK(redactor.redact("nothing to hide", {}) == "nothing to hide");
    CHECK(redactor.redact("", {}).empty());
}

TEST_CASE("Redactor: deterministic and input unchanged", "[redactor]") {
    Redactor redactor;
    const std::string text = "id: 223j1ao5g end";
    const std::string copy = text;
    const std::vector<Span> spans = {{"SCHOOL_ID", 4, 13, 0.8}};

    const auto first = redactor.redact(text, spans);
    const auto second = redactor.redact(text, spans);
    CHECK(first == "id: [PII:SCHOOL_ID] end");
    CHECK(first == second);
    CHECK(text == copy);
}

TEST_CASE("Redactor: multi-byte text keeps surrounding bytes", "[redactor]") {
    Redactor redactor;
    const std::string text = "Caf\xC3\xA9 bob@x.io \xE2\x9C\x93";
    const std::vector<Span> spans = {{"EMAIL_ADDRESS", 6, 14, 1.0}};
    CHECK(redactor.redact(text, spans) == "Caf\xC3\xA9 [PII:EMAIL_ADDRESS] \xE2\x9C\x93");
}

// ============================================================================
// Precondition violations
// ============================================================================

TEST_CASE("Redactor: overlapping spans rejected", "[redactor]") {
    Redactor redactor;
    CHECK_THROWS_AS(redactor.redact("0123456789abcdef", {{"A", 0, 10, 0.9}, {"B", 5, 15, 0.9}}),
                    OverlappingSpanError);
}

TEST_CASE("Redactor: unsorted spans rejected", "[redactor]") {
    Redactor redactor;
    CHECK_THROWS_AS(redactor.redact("0123456789", {{"A", 6, 8, 0.9}, {"B", 0, 2, 0.9}}),
                    OverlappingSpanError);
}

TEST_CASE("Redactor: out-of-range and empty spans rejected", "[redactor]") {
    Redactor redactor;
    CHECK_THROWS_AS(redactor.redact("short", {{"A", 2, 9, 0.9}}), OverlappingSpanError);
    CHECK_THROWS_AS(redactor.redact("short", {{"A", 2, 2, 0.9}}), OverlappingSpanError);
    CHECK_THROWS_AS(redactor.redact("", {{"A", 0, 1, 0.9}}), OverlappingSpanError);
}

// ============================================================================
// MASK / HASH actions
// ============================================================================

TEST_CASE("Redactor: per-type actions", "[redactor]") {
    RedactorOptions options;
    options.actions["CREDIT_CARD"] = RedactionAction::MASK;
    options.actions["EMAIL_ADDRESS"] = RedactionAction::HASH;
    Redactor redactor(options);

    CHECK(redactor.options().actions.size() == 2);
    CHECK(redactor.action_for("CREDIT_CARD") == RedactionAction::MASK);
    CHECK(redactor.action_for("PERSON") == RedactionAction::REPLACE);

    const std::string text = "card 4111111111111111 for a@b.co by Ann";
    const std::vector<Span> spans = {
        {"CREDIT_CARD", 5, 21, 1.0},
        {"EMAIL_ADDRESS", 26, 32, 1.0},
        {"PERSON", 36, 39, 0.85},
    };
    const auto out = redactor.redact(text, spans);

    CHECK(out.starts_with("card **************** for [PII:EMAIL_ADDRESS:"));
    CHECK(out.ends_with("] by [PII:PERSON]"));

    // Hash: 16 lowercase hex chars, stable for equal values
    const auto open = out.find("[PII:EMAIL_ADDRESS:") + 19;
    const auto hash = out.substr(open, out.find(']', open) - open);
    REQUIRE(hash.size() == 16);
    for (char c : hash) {
        CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }
    CHECK(redactor.redact("a@b.co", {{"EMAIL_ADDRESS", 0, 6, 1.0}}) ==
          "[PII:EMAIL_ADDRESS:" + hash + "]");
    CHECK(redactor.redact("c@d.co", {{"EMAIL_ADDRESS", 0, 6, 1.0}}) !=
          "[PII:EMAIL_ADDRESS:" + hash + "]");
}

TEST_CASE("Redactor: default action applies to unlisted types", "[redactor]") {
    RedactorOptions options;
    options.default_action = RedactionAction::MASK;
    Redactor redactor(options);

    CHECK(redactor.redact("pin 1234 ok", {{"PIN", 4, 8, 0.5}}) == "pin **** ok");
}
