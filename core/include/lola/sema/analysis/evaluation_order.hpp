// lola/sema/analysis/evaluation_order.hpp - Topological evaluation order
#pragma once

#include <cstdint>
#include <vector>

#include "lola/sema/graph/stream_graph.hpp"

namespace lola
{

struct EvaluationOrder
{
  /// Streams in evaluation order; accessed streams come before accessors.
  std::vector<StreamId> order;

  /// Layer per stream id: longest synchronous path from a stream without
  /// synchronous dependencies (inputs are always layer 0).
  std::vector<uint32_t> layers;

  /// Streams on a synchronous cycle, in declaration order
  std::vector<StreamId> unscheduled;

  [[nodiscard]] bool complete() const noexcept { return unscheduled.empty(); }
};

/**
 * Kahn's algorithm over synchronous edges (current and hold accesses).
 *
 * Ready streams are taken smallest id first, so the order is a function of
 * the graph alone. Self-accesses are ignored here; they are cycles and are
 * reported by the DependencyCycleChecker.
 */
[[nodiscard]] EvaluationOrder compute_evaluation_order(const StreamGraph & graph);

/// Whether `order` respects every synchronous edge of `graph`.
[[nodiscard]] bool is_valid_evaluation_order(
  const StreamGraph & graph, const std::vector<StreamId> & order);

/**
 * Flag streams that depend, directly or through any chain of accesses, on a
 * lookahead access. Their values are only known after future inputs arrive.
 */
void mark_future_dependent(StreamGraph & graph);

}  // namespace lola
