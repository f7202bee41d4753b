// lola/sema/analysis/dependency_cycle_checker.cpp - Dependency cycle detection
#include "lola/sema/analysis/dependency_cycle_checker.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <limits>
#include <set>
#include <utility>

namespace lola
{

namespace
{

enum class Color : uint8_t { White, Gray, Black };

/// Dependencies of `id`, ordered by accessed stream then edge id
std::vector<EdgeId> sorted_dependencies(const StreamGraph & graph, StreamId id)
{
  std::vector<EdgeId> deps = graph.dependencies_of(id);
  std::sort(deps.begin(), deps.end(), [&](EdgeId a, EdgeId b) {
    const StreamId sa = graph.reference(a).source;
    const StreamId sb = graph.reference(b).source;
    return sa != sb ? sa < sb : a < b;
  });
  return deps;
}

/// Rotation-invariant identity of a cycle
std::vector<EdgeId> canonical(std::vector<EdgeId> edges)
{
  const auto smallest = std::min_element(edges.begin(), edges.end());
  std::rotate(edges.begin(), smallest, edges.end());
  return edges;
}

struct Frame
{
  StreamId stream;
  std::vector<EdgeId> deps;
  size_t next = 0;
};

constexpr uint32_t k_no_component = std::numeric_limits<uint32_t>::max();

/**
 * Strongly connected components (Kosaraju).
 *
 * `finish` is the DFS finishing order over dependency edges; the second pass
 * walks dependents in reverse finishing order.
 */
std::vector<uint32_t> components_of(const StreamGraph & graph, const std::vector<StreamId> & finish)
{
  std::vector<uint32_t> component(graph.stream_count(), k_no_component);
  uint32_t next = 0;

  for (auto it = finish.rbegin(); it != finish.rend(); ++it) {
    if (component[*it] != k_no_component) continue;

    std::vector<StreamId> pending{*it};
    component[*it] = next;
    while (!pending.empty()) {
      const StreamId id = pending.back();
      pending.pop_back();
      for (const EdgeId e : graph.dependents_of(id)) {
        const StreamId reader = graph.reference(e).target;
        if (component[reader] == k_no_component) {
          component[reader] = next;
          pending.push_back(reader);
        }
      }
    }
    ++next;
  }
  return component;
}

/**
 * Shortest dependency path from `from` to `to` inside one component.
 *
 * The first edge is a dependency of `from`; the last one accesses `to`.
 */
std::vector<EdgeId> path_within(
  const StreamGraph & graph, const std::vector<uint32_t> & component, StreamId from, StreamId to)
{
  if (from == to) return {};

  constexpr EdgeId k_none = std::numeric_limits<EdgeId>::max();
  std::vector<EdgeId> via(graph.stream_count(), k_none);
  std::vector<bool> visited(graph.stream_count(), false);
  std::deque<StreamId> queue{from};
  visited[from] = true;

  while (!queue.empty() && !visited[to]) {
    const StreamId id = queue.front();
    queue.pop_front();
    for (const EdgeId e : sorted_dependencies(graph, id)) {
      const StreamId next = graph.reference(e).source;
      if (visited[next] || component[next] != component[from]) continue;
      visited[next] = true;
      via[next] = e;
      queue.push_back(next);
    }
  }

  std::vector<EdgeId> path;
  for (StreamId at = to; at != from && via[at] != k_none; at = graph.reference(via[at]).target) {
    path.push_back(via[at]);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

}  // namespace

bool DependencyCycleChecker::check(const StreamGraph & graph)
{
  has_errors_ = false;
  error_count_ = 0;
  cycles_.clear();

  const size_t n = graph.stream_count();
  std::vector<Color> color(n, Color::White);
  std::set<std::vector<EdgeId>> seen;

  // Path of edges leading to each frame of the DFS stack; path[i] entered
  // stack[i + 1].
  std::vector<Frame> stack;
  std::vector<EdgeId> path;
  std::vector<StreamId> finish;
  finish.reserve(n);

  for (StreamId root = 0; root < n; ++root) {
    if (color[root] != Color::White) continue;

    color[root] = Color::Gray;
    stack.push_back(Frame{root, sorted_dependencies(graph, root)});

    while (!stack.empty()) {
      Frame & top = stack.back();
      if (top.next == top.deps.size()) {
        color[top.stream] = Color::Black;
        finish.push_back(top.stream);
        stack.pop_back();
        if (!path.empty()) path.pop_back();
        continue;
      }

      const EdgeId e = top.deps[top.next++];
      const StreamId next = graph.reference(e).source;

      if (color[next] == Color::Gray) {
        // Back-edge: the cycle runs from the frame of `next` to the top.
        size_t start = 0;
        while (stack[start].stream != next) ++start;

        DependencyCycle cycle;
        cycle.edges.assign(path.begin() + static_cast<std::ptrdiff_t>(start), path.end());
        cycle.edges.push_back(e);
        cycle.legal = std::all_of(cycle.edges.begin(), cycle.edges.end(), [&](EdgeId id) {
          return graph.reference(id).offset.breaks_cycles();
        });

        if (seen.insert(canonical(cycle.edges)).second) {
          if (!cycle.legal) report(graph, cycle);
          cycles_.push_back(std::move(cycle));
        }
        continue;
      }

      if (color[next] == Color::White) {
        color[next] = Color::Gray;
        path.push_back(e);
        stack.push_back(Frame{next, sorted_dependencies(graph, next)});
      }
    }
  }

  check_components(graph, finish, seen);
  return !has_errors_;
}

void DependencyCycleChecker::check_components(
  const StreamGraph & graph, const std::vector<StreamId> & finish,
  std::set<std::vector<EdgeId>> & seen)
{
  // Back-edges only close cycles along the DFS tree; an access through a
  // stream finished earlier can still lie on a cycle. Every edge inside a
  // component does, so each one that needs a value must be on a reported
  // cycle.
  const std::vector<uint32_t> component = components_of(graph, finish);

  std::set<EdgeId> covered;
  for (const auto & cycle : cycles_) {
    if (!cycle.legal) covered.insert(cycle.edges.begin(), cycle.edges.end());
  }

  for (EdgeId e = 0; e < graph.reference_count(); ++e) {
    const Reference & ref = graph.reference(e);
    if (ref.offset.breaks_cycles() || covered.count(e) != 0) continue;
    if (component[ref.source] != component[ref.target]) continue;

    DependencyCycle cycle;
    cycle.edges.push_back(e);
    const std::vector<EdgeId> back = path_within(graph, component, ref.source, ref.target);
    cycle.edges.insert(cycle.edges.end(), back.begin(), back.end());
    cycle.legal = false;

    covered.insert(cycle.edges.begin(), cycle.edges.end());
    if (seen.insert(canonical(cycle.edges)).second) {
      report(graph, cycle);
      cycles_.push_back(std::move(cycle));
    }
  }
}

std::string DependencyCycleChecker::path_of(const StreamGraph & graph, const DependencyCycle & cycle)
{
  if (cycle.edges.empty()) return {};

  std::string s(graph.name_of(graph.reference(cycle.edges.front()).target));
  for (const EdgeId e : cycle.edges) {
    s += " -> ";
    s += graph.name_of(graph.reference(e).source);
  }
  return s;
}

void DependencyCycleChecker::report(const StreamGraph & graph, const DependencyCycle & cycle)
{
  has_errors_ = true;
  ++error_count_;
  if (!diags_) return;

  // Primary label on the first access that needs a value of this cycle.
  const auto culprit = std::find_if(cycle.edges.begin(), cycle.edges.end(), [&](EdgeId id) {
    return !graph.reference(id).offset.breaks_cycles();
  });
  const Reference & primary = graph.reference(*culprit);

  auto builder = diags_->report_error(
    DiagnosticKind::IllegalCycle, primary.range,
    "illegal dependency cycle: " + path_of(graph, cycle),
    "'" + std::string(graph.name_of(primary.target)) + "' needs the " +
      (primary.offset.is_lookahead() ? "future" : "current") + " value of '" +
      std::string(graph.name_of(primary.source)) + "'");

  for (const EdgeId e : cycle.edges) {
    const Reference & ref = graph.reference(e);
    builder.with_stream(ref.target);
    if (e != *culprit) {
      builder.with_secondary_label(
        ref.range, std::string(graph.name_of(ref.target)) + " accesses " +
                     std::string(graph.name_of(ref.source)) + " (" + ref.offset.to_string() + ")");
    }
  }
  builder.with_help("break the cycle with a lookback access such as `.offset(by: -1)`");
}

}  // namespace lola
