// lola/sema/analysis/memory_bounds.hpp - Per-stream memory requirements
//
// Requires resolved pacings (PacingAnalyzer) for window accesses.
//
#pragma once

#include "lola/sema/graph/stream_graph.hpp"

namespace lola
{

/**
 * Memory needed to serve every access to `id`.
 *
 * - current or hold access: 1 sample
 * - lookback(n): n + 1 samples
 * - lookahead(n): 1 sample plus n future values
 * - window(d) on a periodic stream: ceil(d * f) samples
 * - window(d) on any other stream: the duration d itself
 *
 * The bound is the maximum over all accesses; an unaccessed stream needs 0.
 * Sample counts saturate at the uint32_t range.
 *
 * @param graph Graph with resolved pacings
 * @param id Accessed stream
 * @return Samples, event-window duration and future values needed for `id`
 */
[[nodiscard]] MemoryBound memory_bound_of(const StreamGraph & graph, StreamId id);

/// Store memory_bound_of() in Stream::memory for every stream.
void compute_memory_bounds(StreamGraph & graph);

}  // namespace lola
