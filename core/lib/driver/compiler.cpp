// lola/driver/compiler.cpp - Analysis driver implementation
//
#include "lola/driver/compiler.hpp"

#include "lola/ir/lowering.hpp"
#include "lola/sema/analysis/graph_analyzer.hpp"
#include "lola/sema/pacing/pacing_analyzer.hpp"
#include "lola/sema/resolution/function_registry.hpp"
#include "lola/sema/resolution/stream_graph_builder.hpp"
#include "lola/sema/types/type_checker.hpp"
#include "lola/syntax/ast_json_reader.hpp"

namespace lola
{

CompileResult Compiler::analyze(Program & program, const CompileOptions & options)
{
  CompileResult result;
  run_pipeline(program, options, result);
  return result;
}

CompileResult Compiler::analyze_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;
  result.ast = std::make_unique<AstContext>();

  AstJsonReader reader(*result.ast, &result.diagnostics);
  Program * program = reader.read_file(file);
  if (!program) {
    return result;
  }

  run_pipeline(*program, options, result);
  return result;
}

void Compiler::run_pipeline(Program & program, const CompileOptions & options, CompileResult & result)
{
  result.types = std::make_unique<TypeContext>();
  result.graph = std::make_unique<StreamGraph>();
  const FunctionRegistry functions;

  // 1. Naming & lowering
  GraphBuildOptions build_options;
  build_options.warn_unused_inputs = options.analysis.warn_unused_inputs;
  StreamGraphBuilder builder(*result.graph, functions, &result.diagnostics, build_options);
  builder.build(program);

  // 2. Type checking
  TypeCheckOptions type_options;
  type_options.default_literals = options.analysis.default_literals;
  TypeChecker type_checker(
    *result.types, *result.graph, functions, &result.diagnostics, type_options);
  type_checker.check();

  // 3. Pacing analysis
  PacingAnalyzer pacing(*result.graph, &result.diagnostics, options.analysis.pacing_policy());
  pacing.check();

  // 4. Cycles, memory bounds, evaluation order
  GraphAnalyzer analyzer(&result.diagnostics);
  analyzer.analyze(*result.graph);

  result.success = !result.diagnostics.has_errors();

  // 5. IR (only for a fully analyzed graph)
  if (result.success && options.build_ir) {
    result.ir = IrLowering::lower(*result.graph);
  }
}

}  // namespace lola
