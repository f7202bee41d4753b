// lola/sema/analysis/evaluation_order.cpp - Topological evaluation order
#include "lola/sema/analysis/evaluation_order.hpp"

#include <algorithm>
#include <functional>
#include <queue>

namespace lola
{

EvaluationOrder compute_evaluation_order(const StreamGraph & graph)
{
  const size_t n = graph.stream_count();

  EvaluationOrder result;
  result.layers.assign(n, 0);
  result.order.reserve(n);

  std::vector<size_t> pending(n, 0);
  for (const auto & ref : graph.references()) {
    if (ref.offset.orders_evaluation() && ref.source != ref.target) {
      ++pending[ref.target];
    }
  }

  std::priority_queue<StreamId, std::vector<StreamId>, std::greater<>> ready;
  for (StreamId id = 0; id < n; ++id) {
    if (pending[id] == 0) ready.push(id);
  }

  while (!ready.empty()) {
    const StreamId id = ready.top();
    ready.pop();
    result.order.push_back(id);

    for (const EdgeId e : graph.dependents_of(id)) {
      const Reference & ref = graph.reference(e);
      if (!ref.offset.orders_evaluation() || ref.target == id) continue;

      result.layers[ref.target] = std::max(result.layers[ref.target], result.layers[id] + 1);
      if (--pending[ref.target] == 0) {
        ready.push(ref.target);
      }
    }
  }

  for (StreamId id = 0; id < n; ++id) {
    if (pending[id] > 0) result.unscheduled.push_back(id);
  }
  return result;
}

bool is_valid_evaluation_order(const StreamGraph & graph, const std::vector<StreamId> & order)
{
  const size_t n = graph.stream_count();
  if (order.size() != n) return false;

  std::vector<size_t> position(n, n);
  for (size_t i = 0; i < order.size(); ++i) {
    if (order[i] >= n || position[order[i]] != n) return false;
    position[order[i]] = i;
  }

  return std::all_of(graph.references().begin(), graph.references().end(), [&](const Reference & r) {
    return !r.offset.orders_evaluation() || r.source == r.target ||
           position[r.source] < position[r.target];
  });
}

void mark_future_dependent(StreamGraph & graph)
{
  std::vector<StreamId> work;
  for (const auto & ref : graph.references()) {
    if (ref.offset.is_lookahead() && !graph.stream(ref.target).future_dependent) {
      graph.stream(ref.target).future_dependent = true;
      work.push_back(ref.target);
    }
  }

  while (!work.empty()) {
    const StreamId id = work.back();
    work.pop_back();
    for (const EdgeId e : graph.dependents_of(id)) {
      Stream & accessor = graph.stream(graph.reference(e).target);
      if (!accessor.future_dependent) {
        accessor.future_dependent = true;
        work.push_back(accessor.id);
      }
    }
  }
}

}  // namespace lola
