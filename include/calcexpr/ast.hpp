#pragma once
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "calcexpr/token.hpp"

namespace calcexpr {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct BinaryExpr  { ExprPtr left; TokKind op; ExprPtr right; };
struct UnaryExpr   { TokKind op; ExprPtr operand; };
struct UnitExpr    { ExprPtr operand; TokKind unit; };
struct VarExpr     { std::string name; };
struct GroupExpr   { ExprPtr inner; };
struct CallExpr    { std::string name; std::vector<ExprPtr> args; };
struct LiteralExpr { std::string text; };

/// Expression node. Each node exclusively owns its children.
struct Expr {
    std::variant<BinaryExpr, UnaryExpr, UnitExpr, VarExpr, GroupExpr, CallExpr, LiteralExpr> node;
};

template <class Node>
ExprPtr make_expr(Node n) {
    return std::make_unique<Expr>(Expr{std::move(n)});
}

struct VarDecl  { std::string name; ExprPtr value; };
struct FnDecl   { std::string name; std::vector<std::string> params; ExprPtr body; };
struct ExprStmt { ExprPtr expr; };

struct Stmt {
    std::variant<VarDecl, FnDecl, ExprStmt> node;
};

ExprPtr clone(const Expr& e);
Stmt clone(const Stmt& s);

/// Copy of `expr` with every reference to variable `name` replaced by
/// a group holding a copy of `replacement`.
ExprPtr substitute_var(const Expr& expr, std::string_view name, const Expr& replacement);

/// Names of all variables `expr` refers to.
std::set<std::string> referenced_vars(const Expr& expr);

/// S-expression rendering, e.g. "(* 3 y)" or "(fn f (x) (^ x 2))".
std::string to_string(const Expr& e);
std::string to_string(const Stmt& s);

} // namespace calcexpr
