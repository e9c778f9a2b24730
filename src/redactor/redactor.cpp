#include "redactor/redactor.hpp"
#include "core/error.hpp"

#include <openssl/sha.h>

#include <format>

namespace piishield {

Redactor::Redactor(RedactorOptions options)
    : options_(std::move(options)) {}

std::string Redactor::placeholder(std::string_view type) {
    return std::format("[PII:{}]", type);
}

RedactionAction Redactor::action_for(const std::string& type) const {
    const auto it = options_.actions.find(type);
    return it != options_.actions.end() ? it->second : options_.default_action;
}

std::string Redactor::redact(std::string_view text, const std::vector<Span>& spans) const {
    std::string out;
    out.reserve(text.size() + spans.size() * 16);

    size_t cursor = 0;
    for (size_t i = 0; i < spans.size(); ++i) {
        const Span& span = spans[i];

        if (span.start >= span.end || span.end > text.size()) {
            throw OverlappingSpanError(std::format(
                "Span #{} [{}, {}) is empty or outside text of {} bytes",
                i, span.start, span.end, text.size()));
        }
        if (span.start < cursor) {
            throw OverlappingSpanError(std::format(
                "Span #{} [{}, {}) starts before the end of the previous span ({})",
                i, span.start, span.end, cursor));
        }

        out.append(text.substr(cursor, span.start - cursor));
        emit(out, text.substr(span.start, span.length()), span);
        cursor = span.end;
    }
    out.append(text.substr(cursor));
    return out;
}

void Redactor::emit(std::string& out, std::string_view original, const Span& span) const {
    switch (action_for(span.type)) {
        case RedactionAction::REPLACE:
            out.append(placeholder(span.type));
            return;

        case RedactionAction::MASK:
            out.append(original.size(), '*');
            return;

        case RedactionAction::HASH:
            out.append(std::format("[PII:{}:{}]", span.type, hash_value(original)));
            return;
    }
    out.append(placeholder(span.type));
}

std::string Redactor::hash_value(std::string_view value) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(value.data()),
           value.size(), hash);

    // First 16 hex chars (8 bytes)
    std::string result;
    result.reserve(16);
    for (int i = 0; i < 8; ++i) {
        result += std::format("{:02x}", hash[i]);
    }
    return result;
}

} // namespace piishield
