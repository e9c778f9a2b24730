#pragma once

#include "core/types.hpp"
#include <vector>

namespace piishield {

/**
 * @brief Overlap resolution for the union of all recognizer outputs
 *
 * Priority order (first difference wins):
 *   1. higher score
 *   2. longer span
 *   3. earlier start
 *   4. entity type, then recognizer name (lexicographic, for determinism)
 *
 * Spans are accepted greedily in priority order; a span is discarded when it
 * intersects any already accepted span. Within a group of mutually overlapping
 * spans exactly one survives, and nested spans are never kept alongside their
 * container. The result does not depend on input order.
 *
 * @return Conflict-free spans sorted ascending by start
 */
[[nodiscard]] std::vector<Span> resolve_conflicts(std::vector<Span> spans);

/**
 * @brief true if a outranks b under the priority order above
 */
[[nodiscard]] bool outranks(const Span& a, const Span& b);

/**
 * @brief true if spans are sorted ascending by start and pairwise disjoint
 */
[[nodiscard]] bool is_canonical(const std::vector<Span>& spans);

} // namespace piishield
