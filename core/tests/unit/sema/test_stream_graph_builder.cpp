// tests/unit/sema/test_stream_graph_builder.cpp - Naming & lowering
//
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "../../test_support/spec_builder.hpp"
#include "lola/sema/resolution/function_registry.hpp"
#include "lola/sema/resolution/stream_graph_builder.hpp"

using namespace lola;
using lola::test::SpecBuilder;

namespace
{

struct Lowered
{
  StreamGraph graph;
  DiagnosticBag diags;
  bool ok = false;
};

void lower(SpecBuilder & b, Lowered & out, GraphBuildOptions options = {})
{
  const FunctionRegistry functions;
  StreamGraphBuilder builder(out.graph, functions, &out.diags, options);
  out.ok = builder.build(b.program());
}

}  // namespace

TEST(StreamGraphBuilderTest, AssignsIdsInDeclarationOrder)
{
  SpecBuilder b;
  auto * x = b.input("x", b.type("Float64"));
  auto * y = b.output("y", b.ref("x"));
  auto * t = b.trigger(b.bin(b.ref("y"), BinaryOp::Gt, b.flt("1.0")), "too high");

  Lowered l;
  lower(b, l);
  ASSERT_TRUE(l.ok);
  ASSERT_EQ(l.graph.stream_count(), 3u);
  EXPECT_EQ(x->resolvedStream, 0u);
  EXPECT_EQ(y->resolvedStream, 1u);
  EXPECT_EQ(t->resolvedStream, 2u);
  EXPECT_EQ(l.graph.stream(0).kind, StreamKind::Input);
  EXPECT_EQ(l.graph.stream(2).name, "trigger_0");
  EXPECT_EQ(l.graph.stream(2).message, "too high");
  EXPECT_TRUE(l.graph.is_frozen());
}

TEST(StreamGraphBuilderTest, RecordsOffsetsPerAccess)
{
  SpecBuilder b;
  b.input("x", b.type("Int64"));
  b.output(
    "y", b.bin(
           b.bin(b.ref("x"), BinaryOp::Add, b.dflt(b.offset("x", -2), b.lit(0))), BinaryOp::Add,
           b.dflt(b.window("x", "5", "s", WindowOp::Sum), b.lit(0))));
  b.output("z", b.hold("y"));

  Lowered l;
  lower(b, l);
  ASSERT_TRUE(l.ok);
  ASSERT_EQ(l.graph.reference_count(), 4u);

  const auto & deps = l.graph.dependencies_of(1);
  ASSERT_EQ(deps.size(), 3u);
  EXPECT_EQ(l.graph.reference(deps[0]).offset, Offset::current());
  EXPECT_EQ(l.graph.reference(deps[1]).offset, Offset::lookback(2));
  EXPECT_EQ(l.graph.reference(deps[2]).offset, Offset::window(Rational(5), WindowOp::Sum));
  EXPECT_EQ(l.graph.dependents_of(0).size(), 3u);

  const auto & z_deps = l.graph.dependencies_of(2);
  ASSERT_EQ(z_deps.size(), 1u);
  const Reference & hold = l.graph.reference(z_deps[0]);
  EXPECT_EQ(hold.source, 1u);
  EXPECT_EQ(hold.target, 2u);
  EXPECT_TRUE(hold.offset.hold);
  EXPECT_FALSE(hold.offset.constrains_pacing());
}

TEST(StreamGraphBuilderTest, ZeroOffsetIsCurrentAccess)
{
  SpecBuilder b;
  b.input("x", b.type("Int64"));
  b.output("y", b.offset("x", 0));

  Lowered l;
  lower(b, l);
  ASSERT_EQ(l.graph.reference_count(), 1u);
  EXPECT_TRUE(l.graph.reference(0).offset.is_current());
  EXPECT_EQ(Offset::lookback(0), Offset::current());
}

TEST(StreamGraphBuilderTest, OffsetOutOfRangeIsRejected)
{
  SpecBuilder b;
  b.input("x", b.type("Int64"));
  b.output("wrap", b.dflt(b.offset("x", -4294967296LL, SourceRange(10, 30)), b.lit(0)));
  b.output("ahead", b.dflt(b.offset("x", 4294967295LL), b.lit(0)));
  b.output("lowest", b.dflt(b.offset("x", std::numeric_limits<int64_t>::min()), b.lit(0)));
  b.output("far", b.dflt(b.offset("x", -4294967294LL), b.lit(0)));

  Lowered l;
  lower(b, l);
  EXPECT_FALSE(l.ok);

  const auto invalid = l.diags.of_kind(DiagnosticKind::InvalidAst);
  ASSERT_EQ(invalid.size(), 3u);
  EXPECT_EQ(invalid[0].primary_range(), SourceRange(10, 30));
  EXPECT_NE(invalid[0].message.find("-4294967296"), std::string::npos);
  EXPECT_EQ(l.diags.count(DiagnosticKind::UndeclaredStream), 0u);

  // Only the largest representable lookback produced an edge.
  ASSERT_EQ(l.graph.reference_count(), 1u);
  EXPECT_TRUE(l.graph.reference(0).offset.is_lookback());
  EXPECT_EQ(l.graph.reference(0).offset.amount, Offset::k_max_amount);
}

TEST(StreamGraphBuilderTest, UnrepresentableWindowDurationIsRejected)
{
  SpecBuilder b;
  b.input("x", b.type("Float64"));
  b.output("y", b.window("x", "1e18", "d", WindowOp::Sum));

  Lowered l;
  lower(b, l);
  EXPECT_EQ(l.diags.count(DiagnosticKind::InvalidAst), 1u);
  EXPECT_EQ(l.graph.reference_count(), 0u);
}

TEST(StreamGraphBuilderTest, UndeclaredStreamReportedOnceWithSpan)
{
  SpecBuilder b;
  b.input("x", b.type("Float64"));
  b.output("y", b.bin(b.ref("x"), BinaryOp::Add, b.ref("velocity", SourceRange(20, 28))));
  b.output("z", b.ref("x"));

  Lowered l;
  lower(b, l);
  EXPECT_FALSE(l.ok);

  const auto undeclared = l.diags.of_kind(DiagnosticKind::UndeclaredStream);
  ASSERT_EQ(undeclared.size(), 1u);
  EXPECT_EQ(undeclared[0].primary_range(), SourceRange(20, 28));
  EXPECT_NE(undeclared[0].message.find("velocity"), std::string::npos);

  // Lowering carried on past the error
  EXPECT_EQ(l.graph.stream_count(), 3u);
  EXPECT_EQ(l.graph.reference_count(), 2u);
}

TEST(StreamGraphBuilderTest, DuplicateDeclarationKeepsFirst)
{
  SpecBuilder b;
  b.input("x", b.type("Float64"), nullptr, SourceRange(0, 1));
  b.output("x", b.lit(1), nullptr, nullptr, SourceRange(10, 11));

  Lowered l;
  lower(b, l);
  EXPECT_FALSE(l.ok);
  ASSERT_EQ(l.graph.stream_count(), 1u);
  EXPECT_TRUE(l.graph.stream(0).is_input());

  const auto dups = l.diags.of_kind(DiagnosticKind::DuplicateDeclaration);
  ASSERT_EQ(dups.size(), 1u);
  EXPECT_EQ(dups[0].primary_range(), SourceRange(10, 11));
  ASSERT_EQ(dups[0].labels.size(), 2u);
  EXPECT_EQ(dups[0].labels[1].range, SourceRange(0, 1));
  EXPECT_EQ(dups[0].code, "E0001");
}

TEST(StreamGraphBuilderTest, UnknownFunctionIsReported)
{
  SpecBuilder b;
  b.input("x", b.type("Float64"));
  b.output("y", b.call("tan", {b.ref("x")}));
  b.output("z", b.call("sqrt", {b.ref("x")}));

  Lowered l;
  lower(b, l);
  EXPECT_EQ(l.diags.count(DiagnosticKind::UndeclaredFunction), 1u);
  // Arguments are still lowered
  EXPECT_EQ(l.graph.reference_count(), 2u);
}

TEST(StreamGraphBuilderTest, WindowDurationMustBeATime)
{
  SpecBuilder b;
  b.input("x", b.type("Float64"));
  b.output("y", b.window("x", "5", "Hz", WindowOp::Sum));
  b.output("z", b.window("x", "0", "s", WindowOp::Sum));

  Lowered l;
  lower(b, l);
  EXPECT_EQ(l.diags.count(DiagnosticKind::UnitMismatch), 1u);
  EXPECT_EQ(l.diags.count(DiagnosticKind::InvalidAst), 1u);
  EXPECT_EQ(l.graph.reference_count(), 0u);
}

TEST(StreamGraphBuilderTest, UnusedInputWarning)
{
  SpecBuilder b;
  b.input("used", b.type("Bool"));
  b.input("unused", b.type("Bool"));
  b.input("clock", b.type("Bool"));
  b.output("y", b.ref("used"), nullptr, b.event(b.ref("clock")));

  Lowered l;
  lower(b, l);
  EXPECT_TRUE(l.ok);
  const auto unused = l.diags.of_kind(DiagnosticKind::UnusedStream);
  ASSERT_EQ(unused.size(), 1u);
  EXPECT_NE(unused[0].message.find("'unused'"), std::string::npos);
  EXPECT_FALSE(l.diags.has_errors());

  Lowered quiet;
  SpecBuilder b2;
  b2.input("unused", b2.type("Bool"));
  lower(b2, quiet, GraphBuildOptions{false});
  EXPECT_TRUE(quiet.diags.empty());
}
