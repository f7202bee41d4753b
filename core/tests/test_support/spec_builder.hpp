// test_support/spec_builder.hpp - Assemble specification ASTs in tests
//
//   SpecBuilder b;
//   b.input("x", b.type("Float64"));
//   b.output("y", b.bin(b.ref("x"), BinaryOp::Add, b.lit(1)));
//   auto result = b.analyze();
//
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "lola/ast/ast.hpp"
#include "lola/ast/ast_context.hpp"
#include "lola/driver/compiler.hpp"

namespace lola::test
{

class SpecBuilder
{
public:
  AstContext & ctx() noexcept { return ctx_; }

  // ---------------------------------------------------------------------------
  // Types and pacing
  // ---------------------------------------------------------------------------

  NamedType * type(std::string_view name, std::string_view unit = {}, SourceRange r = {})
  {
    return ctx_.create<NamedType>(ctx_.intern(name), ctx_.intern(unit), r);
  }

  OptionType * option(TypeNode * inner) { return ctx_.create<OptionType>(inner); }

  TupleType * tuple_type(const std::vector<TypeNode *> & elements)
  {
    return ctx_.create<TupleType>(ctx_.copy_to_arena(elements));
  }

  QuantityLiteralExpr * quantity(std::string_view magnitude, std::string_view unit, SourceRange r = {})
  {
    return ctx_.create<QuantityLiteralExpr>(ctx_.intern(magnitude), ctx_.intern(unit), r);
  }

  FrequencyPacing * frequency(std::string_view magnitude, std::string_view unit = "Hz", SourceRange r = {})
  {
    return ctx_.create<FrequencyPacing>(quantity(magnitude, unit, r), r);
  }

  EventPacing * event(Expr * condition) { return ctx_.create<EventPacing>(condition); }

  // ---------------------------------------------------------------------------
  // Expressions
  // ---------------------------------------------------------------------------

  IntLiteralExpr * lit(int64_t value, SourceRange r = {}) { return ctx_.create<IntLiteralExpr>(value, r); }

  FloatLiteralExpr * flt(std::string_view text, SourceRange r = {})
  {
    return ctx_.create<FloatLiteralExpr>(ctx_.intern(text), r);
  }

  BoolLiteralExpr * boolean(bool value) { return ctx_.create<BoolLiteralExpr>(value); }

  StringLiteralExpr * str(std::string_view value) { return ctx_.create<StringLiteralExpr>(ctx_.intern(value)); }

  StreamRefExpr * ref(std::string_view name, SourceRange r = {})
  {
    return ctx_.create<StreamRefExpr>(ctx_.intern(name), r);
  }

  /// `name.offset(by: by)`
  OffsetExpr * offset(std::string_view name, int64_t by, SourceRange r = {})
  {
    return ctx_.create<OffsetExpr>(ref(name, r), by, r);
  }

  HoldExpr * hold(std::string_view name) { return ctx_.create<HoldExpr>(ref(name)); }

  WindowExpr * window(
    std::string_view name, std::string_view magnitude, std::string_view unit, WindowOp op,
    SourceRange r = {})
  {
    return ctx_.create<WindowExpr>(ref(name, r), quantity(magnitude, unit, r), op, r);
  }

  DefaultExpr * dflt(Expr * value, Expr * fallback) { return ctx_.create<DefaultExpr>(value, fallback); }

  BinaryExpr * bin(Expr * lhs, BinaryOp op, Expr * rhs, SourceRange r = {})
  {
    return ctx_.create<BinaryExpr>(lhs, op, rhs, r);
  }

  UnaryExpr * unary(UnaryOp op, Expr * operand) { return ctx_.create<UnaryExpr>(op, operand); }

  IfExpr * ite(Expr * c, Expr * t, Expr * e) { return ctx_.create<IfExpr>(c, t, e); }

  TupleExpr * tuple(const std::vector<Expr *> & elements)
  {
    return ctx_.create<TupleExpr>(ctx_.copy_to_arena(elements));
  }

  TupleAccessExpr * access(Expr * tuple, uint32_t index) { return ctx_.create<TupleAccessExpr>(tuple, index); }

  CastExpr * cast(Expr * expr, TypeNode * target) { return ctx_.create<CastExpr>(expr, target); }

  CallExpr * call(std::string_view callee, const std::vector<Expr *> & args, SourceRange r = {})
  {
    return ctx_.create<CallExpr>(ctx_.intern(callee), ctx_.copy_to_arena(args), r);
  }

  // ---------------------------------------------------------------------------
  // Declarations
  // ---------------------------------------------------------------------------

  InputDecl * input(
    std::string_view name, TypeNode * type, PacingNode * pacing = nullptr, SourceRange r = {})
  {
    auto * decl = ctx_.create<InputDecl>(ctx_.intern(name), type, r);
    decl->pacing = pacing;
    decl->nameRange = r;
    decls_.push_back(decl);
    return decl;
  }

  OutputDecl * output(
    std::string_view name, Expr * expr, TypeNode * type = nullptr, PacingNode * pacing = nullptr,
    SourceRange r = {})
  {
    auto * decl = ctx_.create<OutputDecl>(ctx_.intern(name), expr, r);
    decl->type = type;
    decl->pacing = pacing;
    decl->nameRange = r;
    decls_.push_back(decl);
    return decl;
  }

  TriggerDecl * trigger(Expr * condition, std::string_view message, PacingNode * pacing = nullptr)
  {
    auto * decl = ctx_.create<TriggerDecl>(condition, ctx_.intern(message));
    decl->pacing = pacing;
    decls_.push_back(decl);
    return decl;
  }

  // ---------------------------------------------------------------------------
  // Finishing
  // ---------------------------------------------------------------------------

  /// Program of all declarations added so far (rebuilt on every call).
  Program & program()
  {
    program_ = ctx_.create<Program>();
    program_->decls = ctx_.copy_to_arena(decls_);
    return *program_;
  }

  CompileResult analyze(const CompileOptions & options = {})
  {
    return Compiler::analyze(program(), options);
  }

private:
  AstContext ctx_;
  std::vector<Decl *> decls_;
  Program * program_ = nullptr;
};

}  // namespace lola::test
