// lola/ir/lowering.cpp - StreamGraph to IR conversion
#include "lola/ir/lowering.hpp"

#include <algorithm>

namespace lola
{

ir::StreamIr IrLowering::lower(const StreamGraph & graph)
{
  ir::StreamIr result;

  std::vector<std::vector<uint32_t>> windows_of(graph.stream_count());
  bool any_lookahead = false;
  bool any_hold = false;

  for (const auto & ref : graph.references()) {
    any_lookahead = any_lookahead || ref.offset.is_lookahead();
    any_hold = any_hold || ref.offset.hold;
    if (!ref.offset.is_window()) continue;

    ir::WindowReference window;
    window.index = static_cast<uint32_t>(result.windows.size());
    window.target = ref.source;
    window.caller = ref.target;
    window.duration = ref.offset.duration;
    window.op = ref.offset.op;
    window.type = ref.expr ? ref.expr->resolvedType : nullptr;
    windows_of[ref.source].push_back(window.index);
    result.windows.push_back(window);
  }

  const auto dependents = [&graph](StreamId id) {
    std::vector<StreamId> out;
    for (const EdgeId e : graph.dependents_of(id)) {
      out.push_back(graph.reference(e).target);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
  };

  for (const auto & stream : graph.streams()) {
    if (stream.is_input()) {
      ir::InputStream in;
      in.reference = stream.id;
      in.name = stream.name;
      in.type = stream.type;
      in.pacing = stream.pacing;
      in.memory = stream.memory;
      in.layer = stream.layer;
      in.dependents = dependents(stream.id);
      in.dependent_windows = windows_of[stream.id];
      result.inputs.push_back(std::move(in));
      continue;
    }

    ir::OutputStream out;
    out.reference = stream.id;
    out.name = stream.name;
    out.type = stream.type;
    out.pacing = stream.pacing;
    out.memory = stream.memory;
    out.layer = stream.layer;
    out.future_dependent = stream.future_dependent;
    for (const EdgeId e : graph.dependencies_of(stream.id)) {
      const Reference & ref = graph.reference(e);
      out.dependencies.push_back(ir::Dependency{ref.source, ref.offset});
    }
    out.input_dependencies = reachable_inputs(graph, stream.id);
    out.dependents = dependents(stream.id);
    out.dependent_windows = windows_of[stream.id];

    if (stream.is_trigger()) {
      out.trigger = static_cast<uint32_t>(result.triggers.size());
      result.triggers.push_back(ir::Trigger{stream.id, stream.message});
    }

    if (stream.pacing.is_periodic()) {
      result.time_driven.push_back(
        ir::TimeDrivenStream{stream.id, stream.pacing.frequency, stream.pacing.period()});
    } else if (stream.pacing.is_event_driven()) {
      result.event_driven.push_back(ir::EventDrivenStream{stream.id, stream.pacing.activation});
    }

    result.outputs.push_back(std::move(out));
  }

  if (any_lookahead) result.feature_flags.push_back(ir::FeatureFlag::DiscreteFutureOffset);
  if (!result.windows.empty()) result.feature_flags.push_back(ir::FeatureFlag::SlidingWindows);
  if (!result.time_driven.empty()) result.feature_flags.push_back(ir::FeatureFlag::Periodic);
  if (any_hold) result.feature_flags.push_back(ir::FeatureFlag::HoldAccess);

  result.evaluation_order = graph.evaluation_order();
  return result;
}

std::vector<StreamId> IrLowering::reachable_inputs(const StreamGraph & graph, StreamId from)
{
  std::vector<bool> visited(graph.stream_count(), false);
  std::vector<StreamId> work{from};
  std::vector<StreamId> inputs;
  visited[from] = true;

  while (!work.empty()) {
    const StreamId id = work.back();
    work.pop_back();
    for (const EdgeId e : graph.dependencies_of(id)) {
      const StreamId source = graph.reference(e).source;
      if (visited[source]) continue;
      visited[source] = true;
      if (graph.stream(source).is_input()) {
        inputs.push_back(source);
      } else {
        work.push_back(source);
      }
    }
  }

  std::sort(inputs.begin(), inputs.end());
  return inputs;
}

}  // namespace lola
