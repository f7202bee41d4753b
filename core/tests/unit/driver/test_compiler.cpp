// tests/unit/driver/test_compiler.cpp - End-to-end analysis pipeline tests
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "lola/driver/compiler.hpp"
#include "lola/sema/types/type.hpp"
#include "test_support/spec_builder.hpp"

using namespace lola;
namespace fs = std::filesystem;

TEST(CompilerTest, SuccessfulAnalysisProducesIr)
{
  test::SpecBuilder b;
  b.input("elapsed", b.type("Float64", "s"));
  b.output("late", b.bin(b.ref("elapsed"), BinaryOp::Gt, b.quantity("30", "s")));
  b.trigger(b.ref("late"), "too late");

  const CompileResult result = b.analyze();
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.diagnostics.has_errors());
  ASSERT_TRUE(result.ir.has_value());
  EXPECT_EQ(result.ir->outputs.size(), 2u);
  EXPECT_EQ(result.graph->stream(*result.graph->find("late")).type->to_string(), "Bool");
}

TEST(CompilerTest, BuildIrCanBeDisabled)
{
  test::SpecBuilder b;
  b.input("a", b.type("Int64"));
  b.output("x", b.ref("a"));

  CompileOptions options;
  options.build_ir = false;
  const CompileResult result = b.analyze(options);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.ir.has_value());
  ASSERT_NE(result.graph, nullptr);
  EXPECT_FALSE(result.graph->evaluation_order().empty());
}

TEST(CompilerTest, ErrorsFromAllPassesAccumulate)
{
  // x reads an undeclared stream, y mixes Bool and Int64, z has a
  // synchronous self-dependency.
  test::SpecBuilder b;
  b.input("a", b.type("Int64"));
  b.input("flag", b.type("Bool"));
  b.output("x", b.bin(b.ref("missing"), BinaryOp::Add, b.ref("a")));
  b.output("y", b.bin(b.ref("flag"), BinaryOp::Add, b.ref("a")));
  b.output("z", b.bin(b.ref("z"), BinaryOp::Add, b.ref("a")));

  const CompileResult result = b.analyze();
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.ir.has_value());
  EXPECT_EQ(result.diagnostics.count(DiagnosticKind::UndeclaredStream), 1u);
  EXPECT_GE(result.diagnostics.count(DiagnosticKind::TypeMismatch), 1u);
  EXPECT_EQ(result.diagnostics.count(DiagnosticKind::IllegalCycle), 1u);

  // Analyses still annotated the graph.
  ASSERT_NE(result.graph, nullptr);
  EXPECT_EQ(result.graph->evaluation_order().size(), result.graph->stream_count());
}

TEST(CompilerTest, WarningsDoNotFail)
{
  test::SpecBuilder b;
  b.input("a", b.type("Int64"));
  b.input("unused", b.type("Int64"));
  b.output("x", b.ref("a"));

  const CompileResult result = b.analyze();
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.diagnostics.count(DiagnosticKind::UnusedStream), 1u);
  EXPECT_TRUE(result.ir.has_value());
}

TEST(CompilerTest, OptionsReachThePasses)
{
  test::SpecBuilder b;
  b.input("a", b.type("Int64"));
  b.input("c", b.type("Int64"));
  b.output("x", b.bin(b.ref("a"), BinaryOp::Add, b.ref("c")));

  CompileOptions options;
  options.analysis.event_combination = EventCombination::All;
  const CompileResult result = b.analyze(options);
  ASSERT_TRUE(result.success);

  const StreamGraph & g = *result.graph;
  const Pacing & pacing = g.stream(*g.find("x")).pacing;
  EXPECT_EQ(pacing.to_string([&g](uint32_t id) { return std::string(g.name_of(id)); }), "a & c");
}

TEST(CompilerTest, AnalyzeFile)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path file = fs::temp_directory_path() / ("lola_compile_" + std::to_string(now) + ".json");
  {
    std::ofstream out(file);
    out << R"json({"decls": [
      {"kind": "input", "name": "a", "type": "Float64"},
      {"kind": "output", "name": "avg", "pacing": "1Hz",
       "expr": {"kind": "default",
                "value": {"kind": "window", "stream": "a", "duration": "10s", "op": "average"},
                "fallback": {"kind": "float", "value": "0.0"}}}
    ]})json";
  }

  const CompileResult result = Compiler::analyze_file(file, CompileOptions{});
  fs::remove(file);

  EXPECT_TRUE(result.success);
  ASSERT_TRUE(result.ir.has_value());
  EXPECT_EQ(result.ir->time_driven.size(), 1u);
  EXPECT_EQ(result.ir->windows.size(), 1u);
}

TEST(CompilerTest, UnrepresentableLiteralsAreReported)
{
  test::SpecBuilder b;
  b.input("x", b.type("Float64"), b.frequency("1e18", "d"));
  b.output("y", b.window("x", "1e18", "d", WindowOp::Sum));
  b.output("z", b.bin(b.ref("x"), BinaryOp::Gt, b.quantity("1e18", "d")));

  CompileResult result;
  EXPECT_NO_THROW(result = b.analyze());
  EXPECT_FALSE(result.success);
  EXPECT_GE(result.diagnostics.count(DiagnosticKind::InvalidAst), 2u);
  EXPECT_FALSE(result.ir.has_value());
}

TEST(CompilerTest, AnalyzeMissingFile)
{
  const CompileResult result =
    Compiler::analyze_file("/nonexistent/spec.json", CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.count(DiagnosticKind::IoError), 1u);
  EXPECT_EQ(result.graph, nullptr);
}
