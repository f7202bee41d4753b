// lola/sema/analysis/dependency_cycle_checker.hpp - Dependency cycle detection
//
// A cycle in the stream graph is legal only if every edge in it reads
// retained history: a strictly positive lookback or a window. Any other edge
// (synchronous, hold or lookahead access) would need a value before it can be
// computed.
//
#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

#include "lola/basic/diagnostic.hpp"
#include "lola/sema/graph/stream_graph.hpp"

namespace lola
{

/// One cycle, closed by a DFS back-edge or found through a component.
struct DependencyCycle
{
  /// Edges in access order: edges[i].target accesses edges[i].source and
  /// edges[i].source == edges[i + 1].target.
  std::vector<EdgeId> edges;
  bool legal = false;
};

/**
 * Detect dependency cycles with a colouring DFS.
 *
 * Streams are visited in declaration order and their dependencies sorted by
 * accessed stream, so the reported cycles are deterministic. Each distinct
 * illegal cycle is reported once as IllegalCycle.
 *
 * The DFS only sees cycles along its tree. A second pass over the strongly
 * connected components makes sure that every synchronous, hold or lookahead
 * access inside a component lies on some reported cycle; for each one not yet
 * covered, the shortest way back through the component is reported.
 */
class DependencyCycleChecker
{
public:
  explicit DependencyCycleChecker(DiagnosticBag * diags = nullptr) : diags_(diags) {}

  /**
   * Find the dependency cycles of `graph`.
   *
   * @param graph Frozen graph
   * @return true if every cycle is legal
   */
  bool check(const StreamGraph & graph);

  /// All cycles found by the last check(), legal ones included
  [[nodiscard]] const std::vector<DependencyCycle> & cycles() const noexcept { return cycles_; }

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] size_t error_count() const noexcept { return error_count_; }

  /// "a -> b -> a"
  [[nodiscard]] static std::string path_of(const StreamGraph & graph, const DependencyCycle & cycle);

private:
  void check_components(
    const StreamGraph & graph, const std::vector<StreamId> & finish,
    std::set<std::vector<EdgeId>> & seen);
  void report(const StreamGraph & graph, const DependencyCycle & cycle);

  DiagnosticBag * diags_ = nullptr;
  std::vector<DependencyCycle> cycles_;
  bool has_errors_ = false;
  size_t error_count_ = 0;
};

}  // namespace lola
