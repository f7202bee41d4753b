// tests/unit/sema/test_graph_analyzer.cpp - Cycle, memory and ordering tests
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "lola/basic/diagnostic.hpp"
#include "lola/sema/analysis/dependency_cycle_checker.hpp"
#include "lola/sema/analysis/evaluation_order.hpp"
#include "lola/sema/analysis/graph_analyzer.hpp"
#include "lola/sema/analysis/memory_bounds.hpp"
#include "lola/sema/graph/stream_graph.hpp"
#include "lola/sema/types/type.hpp"
#include "test_support/spec_builder.hpp"

using namespace lola;

namespace
{

StreamId add(StreamGraph & g, const std::string & name, StreamKind kind = StreamKind::Output)
{
  Stream s;
  s.name = name;
  s.kind = kind;
  return g.add_stream(std::move(s));
}

// `target` reads `source`
EdgeId read(StreamGraph & g, StreamId target, StreamId source, Offset offset = Offset::current())
{
  Reference ref;
  ref.source = source;
  ref.target = target;
  ref.offset = offset;
  ref.range = SourceRange(target * 10, target * 10 + 1);
  return g.add_reference(ref);
}

}  // namespace

// ============================================================================
// Cycles
// ============================================================================

TEST(DependencyCycleTest, AcyclicGraph)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, b, a);
  read(g, c, b);
  read(g, c, a);
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_TRUE(checker.check(g));
  EXPECT_TRUE(checker.cycles().empty());
  EXPECT_TRUE(diags.empty());
}

TEST(DependencyCycleTest, SynchronousSelfAccessIsIllegal)
{
  StreamGraph g;
  const auto x = add(g, "x");
  read(g, x, x);
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_FALSE(checker.check(g));
  EXPECT_EQ(checker.error_count(), 1u);
  ASSERT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);

  const auto found = diags.of_kind(DiagnosticKind::IllegalCycle);
  const Diagnostic & d = found.front();
  EXPECT_EQ(d.code, "E0301");
  EXPECT_NE(d.message.find("x -> x"), std::string::npos);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_NE(d.help_message->find(".offset(by: -1)"), std::string::npos);
}

TEST(DependencyCycleTest, LookbackSelfAccessIsLegal)
{
  StreamGraph g;
  const auto x = add(g, "x");
  read(g, x, x, Offset::lookback(1));
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_TRUE(checker.check(g));
  ASSERT_EQ(checker.cycles().size(), 1u);
  EXPECT_TRUE(checker.cycles().front().legal);
  EXPECT_TRUE(diags.empty());
}

TEST(DependencyCycleTest, TwoStreamCycleReportsPath)
{
  StreamGraph g;
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y);
  read(g, y, x);
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_FALSE(checker.check(g));
  ASSERT_EQ(checker.cycles().size(), 1u);
  EXPECT_EQ(DependencyCycleChecker::path_of(g, checker.cycles().front()), "x -> y -> x");

  ASSERT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);
  const auto found = diags.of_kind(DiagnosticKind::IllegalCycle);
  const Diagnostic & d = found.front();
  EXPECT_EQ(d.streams.size(), 2u);
}

TEST(DependencyCycleTest, CycleWithOneSynchronousEdgeIsIllegal)
{
  // x = y, y = x.offset(by: -1)
  StreamGraph g;
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y);
  read(g, y, x, Offset::lookback(1));
  g.freeze();

  DependencyCycleChecker checker;
  EXPECT_FALSE(checker.check(g));
  ASSERT_EQ(checker.cycles().size(), 1u);
  EXPECT_FALSE(checker.cycles().front().legal);
  EXPECT_EQ(checker.error_count(), 1u);
}

TEST(DependencyCycleTest, CycleOfOnlyLookbacksAndWindowsIsLegal)
{
  StreamGraph g;
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y, Offset::window(Rational(5), WindowOp::Sum));
  read(g, y, x, Offset::lookback(2));
  g.freeze();

  DependencyCycleChecker checker;
  EXPECT_TRUE(checker.check(g));
  ASSERT_EQ(checker.cycles().size(), 1u);
  EXPECT_TRUE(checker.cycles().front().legal);
}

TEST(DependencyCycleTest, HoldDoesNotBreakCycles)
{
  StreamGraph g;
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y, Offset::sample_and_hold());
  read(g, y, x);
  g.freeze();

  DependencyCycleChecker checker;
  EXPECT_FALSE(checker.check(g));
}

TEST(DependencyCycleTest, LookaheadDoesNotBreakCycles)
{
  StreamGraph g;
  const auto x = add(g, "x");
  read(g, x, x, Offset::lookahead(1));
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_FALSE(checker.check(g));
  ASSERT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);
  const auto found = diags.of_kind(DiagnosticKind::IllegalCycle);
  EXPECT_NE(found.front().labels.front().message.find("future"), std::string::npos);
}

TEST(DependencyCycleTest, CycleThroughFinishedStreamIsFound)
{
  // a = b.offset(by: -1) + c, b = a.offset(by: -1), c = b.offset(by: 1)
  // The DFS closes a -> b -> a first; a -> c -> b -> a only runs through b
  // after b is finished.
  StreamGraph g;
  const auto a = add(g, "a");
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, a, b, Offset::lookback(1));
  const EdgeId sync = read(g, a, c);
  read(g, b, a, Offset::lookback(1));
  read(g, c, b, Offset::lookahead(1));
  g.freeze();

  DiagnosticBag diags;
  DependencyCycleChecker checker(&diags);
  EXPECT_FALSE(checker.check(g));
  EXPECT_EQ(checker.error_count(), 1u);
  ASSERT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);

  const auto illegal = std::find_if(
    checker.cycles().begin(), checker.cycles().end(),
    [](const DependencyCycle & cycle) { return !cycle.legal; });
  ASSERT_NE(illegal, checker.cycles().end());
  EXPECT_EQ(illegal->edges.front(), sync);
  EXPECT_EQ(DependencyCycleChecker::path_of(g, *illegal), "a -> c -> b -> a");

  const auto found = diags.of_kind(DiagnosticKind::IllegalCycle);
  EXPECT_NE(found.front().message.find("a -> c -> b -> a"), std::string::npos);
  EXPECT_NE(found.front().labels.front().message.find("current value of 'c'"), std::string::npos);
}

TEST(DependencyCycleTest, EverySynchronousEdgeInComponentIsCovered)
{
  // a -> c -> d -> b -> a with c -> a and a -> b -> a closed by lookbacks;
  // both synchronous edges must end up on a reported cycle.
  StreamGraph g;
  const auto a = add(g, "a");
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  const auto d = add(g, "d");
  read(g, a, b, Offset::lookback(2));
  read(g, b, a, Offset::lookback(1));
  read(g, a, c);
  read(g, c, d);
  read(g, d, b, Offset::lookback(1));
  read(g, c, a, Offset::lookback(3));
  g.freeze();

  DependencyCycleChecker checker;
  EXPECT_FALSE(checker.check(g));

  std::vector<bool> on_illegal_cycle(g.reference_count(), false);
  for (const auto & cycle : checker.cycles()) {
    if (cycle.legal) continue;
    for (const EdgeId e : cycle.edges) on_illegal_cycle[e] = true;
  }
  for (EdgeId e = 0; e < g.reference_count(); ++e) {
    if (!g.reference(e).offset.breaks_cycles()) {
      EXPECT_TRUE(on_illegal_cycle[e]) << "edge " << e;
    }
  }
}

TEST(GraphAnalyzerTest, CycleThroughFinishedStreamFailsAnalysis)
{
  StreamGraph g;
  const auto a = add(g, "a");
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, a, b, Offset::lookback(1));
  read(g, a, c);
  read(g, b, a, Offset::lookback(1));
  read(g, c, b, Offset::lookahead(1));
  g.freeze();

  DiagnosticBag diags;
  GraphAnalyzer analyzer(&diags);
  EXPECT_FALSE(analyzer.analyze(g));
  EXPECT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);
  EXPECT_EQ(diags.count(DiagnosticKind::SchedulingCycle), 0u);
}

// ============================================================================
// Memory Bounds
// ============================================================================

TEST(MemoryBoundTest, UnaccessedStreamNeedsNothing)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  g.freeze();
  EXPECT_EQ(memory_bound_of(g, a), MemoryBound{});
}

TEST(MemoryBoundTest, MaximumOverAccesses)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, b, a);
  read(g, c, a, Offset::lookback(4));
  read(g, c, b, Offset::lookback(1));
  g.freeze();

  compute_memory_bounds(g);
  EXPECT_EQ(g.stream(a).memory.samples, 5u);
  EXPECT_EQ(g.stream(b).memory.samples, 2u);
  EXPECT_EQ(g.stream(c).memory.samples, 0u);
  EXPECT_EQ(g.stream(a).memory.to_string(), "5");
}

TEST(MemoryBoundTest, LookaheadBuffersFutureValues)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  read(g, b, a, Offset::lookahead(2));
  g.freeze();

  const MemoryBound bound = memory_bound_of(g, a);
  EXPECT_EQ(bound.samples, 1u);
  EXPECT_EQ(bound.future_values, 2u);
  EXPECT_EQ(bound.to_string(), "1 (+2 future)");
}

TEST(MemoryBoundTest, WindowOverPeriodicStreamCountsSamples)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  // 2.5s at 4Hz -> 10 samples; 0.1s at 4Hz -> ceil(0.4) = 1
  read(g, b, a, Offset::window(Rational(5, 2), WindowOp::Sum));
  read(g, b, a, Offset::window(Rational(1, 10), WindowOp::Count));
  g.stream(a).pacing = Pacing::periodic(Rational(4));
  g.freeze();

  const MemoryBound bound = memory_bound_of(g, a);
  EXPECT_EQ(bound.samples, 10u);
  EXPECT_FALSE(bound.is_unbounded_by_samples());
}

TEST(MemoryBoundTest, HugeBoundsSaturate)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  const int64_t big = std::numeric_limits<int64_t>::max();
  read(g, b, a, Offset::window(Rational(big), WindowOp::Sum));
  read(g, c, b, Offset::lookback(Offset::k_max_amount));
  g.stream(a).pacing = Pacing::periodic(Rational(big, 2));
  g.freeze();

  EXPECT_EQ(memory_bound_of(g, a).samples, std::numeric_limits<uint32_t>::max());
  EXPECT_EQ(memory_bound_of(g, b).samples, std::numeric_limits<uint32_t>::max());
}

TEST(MemoryBoundTest, WindowOverEventStreamKeepsDuration)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  read(g, b, a, Offset::window(Rational(3), WindowOp::Sum));
  read(g, b, a, Offset::window(Rational(7), WindowOp::Max));
  read(g, b, a);
  g.stream(a).pacing = Pacing::event_driven(ActivationCondition::stream(a));
  g.freeze();

  const MemoryBound bound = memory_bound_of(g, a);
  EXPECT_EQ(bound.samples, 1u);
  ASSERT_TRUE(bound.duration.has_value());
  EXPECT_EQ(*bound.duration, Rational(7));
  EXPECT_TRUE(bound.is_unbounded_by_samples());
}

// ============================================================================
// Evaluation Order
// ============================================================================

TEST(EvaluationOrderTest, AccessedStreamsComeFirst)
{
  StreamGraph g;
  const auto c = add(g, "c");
  const auto b = add(g, "b");
  const auto a = add(g, "a", StreamKind::Input);
  read(g, c, b);
  read(g, b, a);
  g.freeze();

  const EvaluationOrder eval = compute_evaluation_order(g);
  EXPECT_TRUE(eval.complete());
  EXPECT_EQ(eval.order, (std::vector<StreamId>{a, b, c}));
  EXPECT_TRUE(is_valid_evaluation_order(g, eval.order));
  EXPECT_FALSE(is_valid_evaluation_order(g, {c, b, a}));

  EXPECT_EQ(eval.layers[a], 0u);
  EXPECT_EQ(eval.layers[b], 1u);
  EXPECT_EQ(eval.layers[c], 2u);
}

TEST(EvaluationOrderTest, TiesBrokenBySmallestId)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b", StreamKind::Input);
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, y, b);
  read(g, x, a);
  g.freeze();

  const EvaluationOrder first = compute_evaluation_order(g);
  EXPECT_EQ(first.order, (std::vector<StreamId>{a, b, x, y}));
  EXPECT_EQ(compute_evaluation_order(g).order, first.order);
}

TEST(EvaluationOrderTest, LayerIsLongestSynchronousPath)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, b, a);
  read(g, c, a);
  read(g, c, b);
  g.freeze();

  const EvaluationOrder eval = compute_evaluation_order(g);
  EXPECT_EQ(eval.layers[c], 2u);
}

TEST(EvaluationOrderTest, AsynchronousEdgesDoNotOrder)
{
  StreamGraph g;
  const auto x = add(g, "x");
  const auto a = add(g, "a", StreamKind::Input);
  read(g, x, a, Offset::lookback(1));
  read(g, x, x, Offset::lookback(1));
  g.freeze();

  const EvaluationOrder eval = compute_evaluation_order(g);
  EXPECT_TRUE(eval.complete());
  EXPECT_EQ(eval.order, (std::vector<StreamId>{x, a}));
  EXPECT_EQ(eval.layers[x], 0u);
}

TEST(EvaluationOrderTest, HoldOrdersEvaluation)
{
  StreamGraph g;
  const auto x = add(g, "x");
  const auto a = add(g, "a", StreamKind::Input);
  read(g, x, a, Offset::sample_and_hold());
  g.freeze();

  const EvaluationOrder eval = compute_evaluation_order(g);
  EXPECT_EQ(eval.order, (std::vector<StreamId>{a, x}));
}

TEST(EvaluationOrderTest, SynchronousCycleIsUnscheduled)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y);
  read(g, y, x);
  g.freeze();

  const EvaluationOrder eval = compute_evaluation_order(g);
  EXPECT_FALSE(eval.complete());
  EXPECT_EQ(eval.order, (std::vector<StreamId>{a}));
  EXPECT_EQ(eval.unscheduled, (std::vector<StreamId>{x, y}));
}

TEST(EvaluationOrderTest, FutureDependencyPropagates)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  const auto z = add(g, "z");
  read(g, x, a, Offset::lookahead(1));
  read(g, y, x, Offset::lookback(3));
  read(g, z, a);
  g.freeze();

  mark_future_dependent(g);
  EXPECT_FALSE(g.stream(a).future_dependent);
  EXPECT_TRUE(g.stream(x).future_dependent);
  EXPECT_TRUE(g.stream(y).future_dependent);
  EXPECT_FALSE(g.stream(z).future_dependent);
}

// ============================================================================
// GraphAnalyzer
// ============================================================================

TEST(GraphAnalyzerTest, AnnotatesEveryStream)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, a, Offset::lookback(2));
  read(g, y, x);
  read(g, y, a);
  g.freeze();

  DiagnosticBag diags;
  GraphAnalyzer analyzer(&diags);
  EXPECT_TRUE(analyzer.analyze(g));
  EXPECT_TRUE(diags.empty());

  EXPECT_EQ(g.evaluation_order(), (std::vector<StreamId>{a, x, y}));
  EXPECT_EQ(g.stream(a).memory.samples, 3u);
  EXPECT_EQ(g.stream(x).memory.samples, 1u);
  EXPECT_EQ(g.stream(x).layer, 0u);
  EXPECT_EQ(g.stream(y).layer, 1u);
}

TEST(GraphAnalyzerTest, IllegalCycleStillProducesOrder)
{
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto x = add(g, "x");
  const auto y = add(g, "y");
  read(g, x, y);
  read(g, y, x);
  read(g, x, a);
  g.freeze();

  DiagnosticBag diags;
  GraphAnalyzer analyzer(&diags);
  EXPECT_FALSE(analyzer.analyze(g));
  EXPECT_EQ(diags.count(DiagnosticKind::IllegalCycle), 1u);
  EXPECT_EQ(diags.count(DiagnosticKind::SchedulingCycle), 0u);
  EXPECT_EQ(g.evaluation_order(), (std::vector<StreamId>{a, x, y}));
  EXPECT_EQ(g.stream(a).memory.samples, 1u);
}

TEST(GraphAnalyzerTest, RunsOnLoweredSpecification)
{
  // a: Float64; x := a.offset(by: -1).defaults(to: 0.0); y := x + a
  test::SpecBuilder b;
  b.input("a", b.type("Float64"));
  b.output("x", b.dflt(b.offset("a", -1), b.flt("0.0")));
  b.output("y", b.bin(b.ref("x"), BinaryOp::Add, b.ref("a")));

  const CompileResult result = b.analyze();
  ASSERT_TRUE(result.success);
  const StreamGraph & g = *result.graph;

  const auto a = *g.find("a");
  const auto x = *g.find("x");
  const auto y = *g.find("y");
  EXPECT_EQ(g.stream(a).memory.samples, 2u);
  EXPECT_TRUE(is_valid_evaluation_order(g, g.evaluation_order()));
  EXPECT_EQ(g.stream(y).layer, 1u);
  EXPECT_EQ(g.stream(x).layer, 0u);
}

TEST(MemoryBoundTest, LookbackAndWindowOverOwnClock)
{
  // a @10Hz read by b with lookback(3) and by c over a 0.5s window (5 periods)
  StreamGraph g;
  const auto a = add(g, "a", StreamKind::Input);
  const auto b = add(g, "b");
  const auto c = add(g, "c");
  read(g, b, a, Offset::lookback(3));
  read(g, c, a, Offset::window(Rational(1, 2), WindowOp::Sum));
  g.stream(a).pacing = Pacing::periodic(Rational(10));
  g.freeze();

  EXPECT_EQ(memory_bound_of(g, a).samples, 5u);
}

namespace
{

struct Snapshot
{
  std::vector<std::string> names;
  std::vector<std::string> types;
  std::vector<std::string> pacings;
  std::vector<MemoryBound> memory;
  std::vector<std::string> order;

  bool operator==(const Snapshot & o) const
  {
    return names == o.names && types == o.types && pacings == o.pacings && memory == o.memory &&
           order == o.order;
  }
};

Snapshot snapshot_of(const StreamGraph & g)
{
  Snapshot s;
  const auto name_of = [&g](uint32_t id) { return std::string(g.name_of(id)); };
  for (const auto & stream : g.streams()) {
    s.names.push_back(stream.name);
    s.types.push_back(stream.type ? stream.type->to_string() : "");
    s.pacings.push_back(stream.pacing.to_string(name_of));
    s.memory.push_back(stream.memory);
  }
  for (const StreamId id : g.evaluation_order()) {
    s.order.push_back(name_of(id));
  }
  return s;
}

void build_pipeline_spec(test::SpecBuilder & b)
{
  b.input("a", b.type("Float64"), b.frequency("10"));
  b.input("c", b.type("Float64"), b.frequency("5"));
  b.output("d", b.bin(b.ref("c"), BinaryOp::Mul, b.ref("a")));
  b.output("e", b.dflt(b.offset("d", -2), b.flt("0.0")));
  b.output("f", b.bin(b.ref("e"), BinaryOp::Add, b.ref("a")));
}

}  // namespace

TEST(GraphAnalyzerTest, PipelineIsIdempotent)
{
  test::SpecBuilder b;
  build_pipeline_spec(b);

  const CompileResult first = b.analyze();
  const CompileResult second = b.analyze();
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(snapshot_of(*first.graph), snapshot_of(*second.graph));
  EXPECT_TRUE(is_valid_evaluation_order(*first.graph, first.graph->evaluation_order()));
  EXPECT_EQ(first.graph->stream(*first.graph->find("f")).pacing.to_string(), "10Hz");
}

TEST(GraphAnalyzerTest, UnrelatedStreamsDoNotReorder)
{
  test::SpecBuilder plain;
  build_pipeline_spec(plain);
  const CompileResult base = plain.analyze();
  ASSERT_TRUE(base.success);

  test::SpecBuilder extended;
  build_pipeline_spec(extended);
  extended.input("z", extended.type("Int64"));
  extended.output("w", extended.bin(extended.ref("z"), BinaryOp::Add, extended.lit(1)));
  const CompileResult more = extended.analyze();
  ASSERT_TRUE(more.success);

  std::vector<std::string> filtered;
  for (const StreamId id : more.graph->evaluation_order()) {
    const std::string name(more.graph->name_of(id));
    if (name != "z" && name != "w") filtered.push_back(name);
  }
  EXPECT_EQ(filtered, snapshot_of(*base.graph).order);
}
