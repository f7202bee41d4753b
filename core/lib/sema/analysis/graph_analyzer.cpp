// lola/sema/analysis/graph_analyzer.cpp - Whole-graph analyses
#include "lola/sema/analysis/graph_analyzer.hpp"

#include <string>
#include <utility>

#include "lola/sema/analysis/memory_bounds.hpp"

namespace lola
{

bool GraphAnalyzer::analyze(StreamGraph & graph)
{
  has_errors_ = false;
  error_count_ = 0;

  const bool acyclic = cycles_.check(graph);
  if (!acyclic) {
    has_errors_ = true;
    error_count_ += cycles_.error_count();
  }

  compute_memory_bounds(graph);
  schedule(graph, !acyclic);
  mark_future_dependent(graph);

  return !has_errors_;
}

void GraphAnalyzer::schedule(StreamGraph & graph, bool cycles_reported)
{
  EvaluationOrder eval = compute_evaluation_order(graph);

  for (auto & stream : graph.streams()) {
    stream.layer = eval.layers[stream.id];
  }

  if (!eval.complete()) {
    if (!cycles_reported) {
      // The cycle checker accepted a graph whose synchronous part is cyclic.
      has_errors_ = true;
      ++error_count_;
      if (diags_) {
        std::string names;
        for (const StreamId id : eval.unscheduled) {
          if (!names.empty()) names += ", ";
          names += graph.name_of(id);
        }
        auto builder = diags_->report_error(
          DiagnosticKind::SchedulingCycle, get_name_range(graph.stream(eval.unscheduled.front()).decl),
          "internal error: no evaluation order exists for " + names);
        for (const StreamId id : eval.unscheduled) {
          builder.with_stream(id);
        }
      }
    }
    eval.order.insert(eval.order.end(), eval.unscheduled.begin(), eval.unscheduled.end());
  }

  graph.set_evaluation_order(std::move(eval.order));
}

}  // namespace lola
