// tests/unit/syntax/test_ast_json_reader.cpp - AST interchange format tests
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "lola/ast/ast.hpp"
#include "lola/ast/ast_context.hpp"
#include "lola/basic/casting.hpp"
#include "lola/basic/diagnostic.hpp"
#include "lola/syntax/ast_json_reader.hpp"

using namespace lola;

namespace
{

constexpr const char * k_monitor = R"json({
  "decls": [
    { "kind": "input", "name": "altitude", "type": {"kind": "named", "name": "Float64", "unit": "m"},
      "range": [0, 24], "nameRange": [6, 14] },
    { "kind": "output", "name": "climb", "pacing": "10Hz",
      "expr": { "kind": "binary", "op": "-",
                "lhs": {"kind": "stream", "name": "altitude", "range": [40, 48]},
                "rhs": {"kind": "default",
                        "value": {"kind": "offset", "stream": "altitude", "by": -1},
                        "fallback": {"kind": "float", "value": "0.0"}} } },
    { "kind": "trigger", "message": "too low",
      "condition": { "kind": "binary", "op": "<",
                     "lhs": {"kind": "stream", "name": "altitude"},
                     "rhs": {"kind": "quantity", "value": "100m"} } }
  ]
})json";

}  // namespace

TEST(AstJsonReaderTest, ReadsDeclarations)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  Program * program = reader.read(k_monitor);
  ASSERT_NE(program, nullptr);
  EXPECT_FALSE(reader.has_errors());
  EXPECT_TRUE(diags.empty());
  ASSERT_EQ(program->decls.size(), 3u);

  auto * input = dyn_cast<InputDecl>(program->decls[0]);
  ASSERT_NE(input, nullptr);
  EXPECT_EQ(input->name, "altitude");
  EXPECT_EQ(input->nameRange, SourceRange(6, 14));
  auto * type = dyn_cast<NamedType>(input->type);
  ASSERT_NE(type, nullptr);
  EXPECT_EQ(type->name, "Float64");
  EXPECT_EQ(type->unit, "m");

  auto * output = dyn_cast<OutputDecl>(program->decls[1]);
  ASSERT_NE(output, nullptr);
  auto * pacing = dyn_cast<FrequencyPacing>(output->pacing);
  ASSERT_NE(pacing, nullptr);
  EXPECT_EQ(pacing->value->magnitude, "10");
  EXPECT_EQ(pacing->value->unit, "Hz");

  auto * sub = dyn_cast<BinaryExpr>(output->expr);
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->op, BinaryOp::Sub);
  EXPECT_EQ(sub->lhs->get_range(), SourceRange(40, 48));
  auto * fallback = dyn_cast<DefaultExpr>(sub->rhs);
  ASSERT_NE(fallback, nullptr);
  auto * offset = dyn_cast<OffsetExpr>(fallback->value);
  ASSERT_NE(offset, nullptr);
  EXPECT_EQ(offset->offset, -1);
  EXPECT_EQ(offset->stream->name, "altitude");

  auto * trigger = dyn_cast<TriggerDecl>(program->decls[2]);
  ASSERT_NE(trigger, nullptr);
  EXPECT_EQ(trigger->message, "too low");
  auto * cmp = dyn_cast<BinaryExpr>(trigger->condition);
  ASSERT_NE(cmp, nullptr);
  auto * q = dyn_cast<QuantityLiteralExpr>(cmp->rhs);
  ASSERT_NE(q, nullptr);
  EXPECT_EQ(q->unit, "m");
}

TEST(AstJsonReaderTest, ShorthandTypesAndEventPacing)
{
  AstContext ctx;
  AstJsonReader reader(ctx);

  Program * program = reader.read(R"json({"decls": [
    {"kind": "input", "name": "a", "type": "Bool"},
    {"kind": "input", "name": "b", "type": {"kind": "option", "inner": "Int32"}},
    {"kind": "output", "name": "c", "type": {"kind": "tuple", "elements": ["Bool", "UInt8"]},
     "pacing": {"kind": "event", "condition":
       {"kind": "binary", "op": "&", "lhs": {"kind": "stream", "name": "a"},
                                     "rhs": {"kind": "stream", "name": "b"}}},
     "expr": {"kind": "tuple", "elements": [{"kind": "bool", "value": true}, {"kind": "int", "value": 3}]}}
  ]})json");

  ASSERT_NE(program, nullptr);
  EXPECT_FALSE(reader.has_errors());
  ASSERT_EQ(program->decls.size(), 3u);

  EXPECT_TRUE(isa<NamedType>(cast<InputDecl>(program->decls[0])->type));
  EXPECT_TRUE(isa<OptionType>(cast<InputDecl>(program->decls[1])->type));

  auto * c = cast<OutputDecl>(program->decls[2]);
  ASSERT_NE(dyn_cast<TupleType>(c->type), nullptr);
  EXPECT_EQ(cast<TupleType>(c->type)->elements.size(), 2u);
  auto * event = dyn_cast<EventPacing>(c->pacing);
  ASSERT_NE(event, nullptr);
  EXPECT_EQ(cast<BinaryExpr>(event->condition)->op, BinaryOp::And);
}

TEST(AstJsonReaderTest, WindowAndCall)
{
  AstContext ctx;
  AstJsonReader reader(ctx);

  Program * program = reader.read(R"json({"decls": [
    {"kind": "output", "name": "w",
     "expr": {"kind": "call", "callee": "sqrt", "args": [
       {"kind": "window", "stream": "x", "duration": "1.5e3ms", "op": "avg"}]}}
  ]})json");

  ASSERT_NE(program, nullptr);
  EXPECT_FALSE(reader.has_errors());
  auto * call = cast<CallExpr>(cast<OutputDecl>(program->decls[0])->expr);
  EXPECT_EQ(call->callee, "sqrt");
  ASSERT_EQ(call->args.size(), 1u);
  auto * window = dyn_cast<WindowExpr>(call->args[0]);
  ASSERT_NE(window, nullptr);
  EXPECT_EQ(window->op, WindowOp::Average);
  EXPECT_EQ(window->duration->magnitude, "1.5e3");
  EXPECT_EQ(window->duration->unit, "ms");
}

TEST(AstJsonReaderTest, InvalidJson)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  EXPECT_EQ(reader.read("{ not json"), nullptr);
  EXPECT_TRUE(reader.has_errors());
  ASSERT_EQ(diags.count(DiagnosticKind::InvalidAst), 1u);
  EXPECT_EQ(diags.of_kind(DiagnosticKind::InvalidAst).front().code, "E0901");
}

TEST(AstJsonReaderTest, MissingDeclsArray)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  EXPECT_EQ(reader.read(R"json({"streams": []})json"), nullptr);
  EXPECT_EQ(diags.count(DiagnosticKind::InvalidAst), 1u);
}

TEST(AstJsonReaderTest, MalformedDeclarationIsSkipped)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  Program * program = reader.read(R"json({"decls": [
    {"kind": "input", "name": "a", "type": "Int64"},
    {"kind": "output", "name": "b", "expr": {"kind": "binary", "op": "+", "rhs": {"kind": "int", "value": 1}}},
    {"kind": "output", "name": "c", "expr": {"kind": "stream", "name": "a"}}
  ]})json");

  ASSERT_NE(program, nullptr);
  EXPECT_TRUE(reader.has_errors());
  EXPECT_EQ(reader.error_count(), 1u);
  ASSERT_EQ(program->decls.size(), 2u);
  EXPECT_EQ(cast<OutputDecl>(program->decls[1])->name, "c");

  const auto errors = diags.of_kind(DiagnosticKind::InvalidAst);
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors.front().message.find("decls[1].expr.lhs"), std::string::npos);
  EXPECT_NE(errors.front().message.find("missing field 'lhs'"), std::string::npos);
}

TEST(AstJsonReaderTest, UnknownKinds)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  Program * program = reader.read(R"json({"decls": [
    {"kind": "constant", "name": "k"},
    {"kind": "output", "name": "x", "expr": {"kind": "lambda"}},
    {"kind": "output", "name": "y", "expr": {"kind": "window", "stream": "x", "duration": "1s", "op": "median"}}
  ]})json");

  ASSERT_NE(program, nullptr);
  EXPECT_TRUE(program->decls.empty());
  const auto errors = diags.of_kind(DiagnosticKind::InvalidAst);
  ASSERT_EQ(errors.size(), 3u);
  EXPECT_NE(errors[0].message.find("unknown declaration kind 'constant'"), std::string::npos);
  EXPECT_NE(errors[1].message.find("unknown expression kind 'lambda'"), std::string::npos);
  EXPECT_NE(errors[2].message.find("unknown window operation 'median'"), std::string::npos);
}

TEST(AstJsonReaderTest, UnreadableFile)
{
  AstContext ctx;
  DiagnosticBag diags;
  AstJsonReader reader(ctx, &diags);

  const auto path = std::filesystem::temp_directory_path() / "lola_missing_dir" / "none.json";
  EXPECT_EQ(reader.read_file(path), nullptr);
  ASSERT_EQ(diags.count(DiagnosticKind::IoError), 1u);
  EXPECT_EQ(diags.of_kind(DiagnosticKind::IoError).front().code, "E0902");
}

TEST(AstJsonReaderTest, ReadsFile)
{
  const auto path = std::filesystem::temp_directory_path() / "lola_reader_test.json";
  {
    std::ofstream out(path);
    out << k_monitor;
  }

  AstContext ctx;
  AstJsonReader reader(ctx);
  Program * program = reader.read_file(path);
  std::filesystem::remove(path);

  ASSERT_NE(program, nullptr);
  EXPECT_EQ(program->decls.size(), 3u);
}
