#include "analyzer/span_resolver.hpp"

#include <algorithm>
#include <iterator>
#include <map>

namespace piishield {

bool outranks(const Span& a, const Span& b) {
    if (a.score != b.score) return a.score > b.score;
    if (a.length() != b.length()) return a.length() > b.length();
    if (a.start != b.start) return a.start < b.start;
    if (a.type != b.type) return a.type < b.type;
    return a.recognizer < b.recognizer;
}

std::vector<Span> resolve_conflicts(std::vector<Span> spans) {
    if (spans.size() < 2) {
        return spans;
    }

    std::stable_sort(spans.begin(), spans.end(), outranks);

    // Accepted spans keyed by start; disjoint, so neighbours decide overlap
    std::map<size_t, Span> accepted;

    for (auto& span : spans) {
        auto next = accepted.lower_bound(span.start);
        if (next != accepted.end() && next->second.start < span.end) {
            continue;
        }
        if (next != accepted.begin()) {
            const auto prev = std::prev(next);
            if (prev->second.end > span.start) {
                continue;
            }
        }
        accepted.emplace_hint(next, span.start, std::move(span));
    }

    std::vector<Span> result;
    result.reserve(accepted.size());
    for (auto& [start, span] : accepted) {
        result.emplace_back(std::move(span));
    }
    return result;
}

bool is_canonical(const std::vector<Span>& spans) {
    for (size_t i = 1; i < spans.size(); ++i) {
        if (spans[i].start < spans[i - 1].end) {
            return false;
        }
    }
    return true;
}

} // namespace piishield
