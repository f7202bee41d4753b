// lola/sema/analysis/memory_bounds.cpp - Per-stream memory requirements
#include "lola/sema/analysis/memory_bounds.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace lola
{

namespace
{

/// ceil(duration * hz), at least one sample; saturates at the uint32 range.
uint32_t window_samples(const Rational & duration, const Rational & hz)
{
  constexpr int64_t k_max = std::numeric_limits<uint32_t>::max();
  try {
    return static_cast<uint32_t>(std::clamp<int64_t>((duration * hz).ceil(), 1, k_max));
  } catch (const std::overflow_error &) {
    return static_cast<uint32_t>(k_max);
  }
}

}  // namespace

MemoryBound memory_bound_of(const StreamGraph & graph, StreamId id)
{
  MemoryBound bound;
  const Pacing & pacing = graph.stream(id).pacing;

  for (const EdgeId e : graph.dependents_of(id)) {
    const Offset & offset = graph.reference(e).offset;

    switch (offset.kind) {
      case OffsetKind::Current:
        bound.samples = std::max<uint32_t>(bound.samples, 1);
        break;
      case OffsetKind::Lookback:
        bound.samples = std::max(bound.samples, offset.amount + 1);
        break;
      case OffsetKind::Lookahead:
        bound.samples = std::max<uint32_t>(bound.samples, 1);
        bound.future_values = std::max(bound.future_values, offset.amount);
        break;
      case OffsetKind::Window:
        if (pacing.is_periodic()) {
          bound.samples = std::max(bound.samples, window_samples(offset.duration, pacing.frequency));
        } else if (!bound.duration || *bound.duration < offset.duration) {
          bound.duration = offset.duration;
        }
        break;
    }
  }
  return bound;
}

void compute_memory_bounds(StreamGraph & graph)
{
  for (auto & stream : graph.streams()) {
    stream.memory = memory_bound_of(graph, stream.id);
  }
}

}  // namespace lola
