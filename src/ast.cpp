#include "calcexpr/ast.hpp"

namespace calcexpr {

namespace {

struct Cloner {
    ExprPtr operator()(const BinaryExpr& b) const {
        return make_expr(BinaryExpr{clone(*b.left), b.op, clone(*b.right)});
    }
    ExprPtr operator()(const UnaryExpr& u) const {
        return make_expr(UnaryExpr{u.op, clone(*u.operand)});
    }
    ExprPtr operator()(const UnitExpr& u) const {
        return make_expr(UnitExpr{clone(*u.operand), u.unit});
    }
    ExprPtr operator()(const VarExpr& v) const { return make_expr(v); }
    ExprPtr operator()(const GroupExpr& g) const {
        return make_expr(GroupExpr{clone(*g.inner)});
    }
    ExprPtr operator()(const CallExpr& c) const {
        CallExpr out{c.name, {}};
        out.args.reserve(c.args.size());
        for (const auto& a : c.args) out.args.push_back(clone(*a));
        return make_expr(std::move(out));
    }
    ExprPtr operator()(const LiteralExpr& l) const { return make_expr(l); }
};

struct Substituter {
    std::string_view name;
    const Expr& replacement;

    ExprPtr apply(const Expr& e) const { return std::visit(*this, e.node); }

    ExprPtr operator()(const BinaryExpr& b) const {
        return make_expr(BinaryExpr{apply(*b.left), b.op, apply(*b.right)});
    }
    ExprPtr operator()(const UnaryExpr& u) const {
        return make_expr(UnaryExpr{u.op, apply(*u.operand)});
    }
    ExprPtr operator()(const UnitExpr& u) const {
        return make_expr(UnitExpr{apply(*u.operand), u.unit});
    }
    ExprPtr operator()(const VarExpr& v) const {
        if (v.name == name) return make_expr(GroupExpr{clone(replacement)});
        return make_expr(v);
    }
    ExprPtr operator()(const GroupExpr& g) const {
        return make_expr(GroupExpr{apply(*g.inner)});
    }
    ExprPtr operator()(const CallExpr& c) const {
        CallExpr out{c.name, {}};
        out.args.reserve(c.args.size());
        for (const auto& a : c.args) out.args.push_back(apply(*a));
        return make_expr(std::move(out));
    }
    ExprPtr operator()(const LiteralExpr& l) const { return make_expr(l); }
};

struct VarCollector {
    std::set<std::string>& out;

    void apply(const Expr& e) const { std::visit(*this, e.node); }

    void operator()(const BinaryExpr& b) const {
        apply(*b.left);
        apply(*b.right);
    }
    void operator()(const UnaryExpr& u) const { apply(*u.operand); }
    void operator()(const UnitExpr& u) const { apply(*u.operand); }
    void operator()(const VarExpr& v) const { out.insert(v.name); }
    void operator()(const GroupExpr& g) const { apply(*g.inner); }
    void operator()(const CallExpr& c) const {
        for (const auto& a : c.args) apply(*a);
    }
    void operator()(const LiteralExpr&) const {}
};

struct Printer {
    std::string operator()(const BinaryExpr& b) const {
        return std::string("(") + to_string(b.op) + " " + to_string(*b.left) + " " + to_string(*b.right) + ")";
    }
    std::string operator()(const UnaryExpr& u) const {
        return std::string("(") + to_string(u.op) + " " + to_string(*u.operand) + ")";
    }
    std::string operator()(const UnitExpr& u) const {
        return std::string("(") + to_string(u.unit) + " " + to_string(*u.operand) + ")";
    }
    std::string operator()(const VarExpr& v) const { return v.name; }
    std::string operator()(const GroupExpr& g) const {
        return "(group " + to_string(*g.inner) + ")";
    }
    std::string operator()(const CallExpr& c) const {
        std::string out = "(call " + c.name;
        for (const auto& a : c.args) out += " " + to_string(*a);
        return out + ")";
    }
    std::string operator()(const LiteralExpr& l) const { return l.text; }
};

} // namespace

ExprPtr clone(const Expr& e) {
    return std::visit(Cloner{}, e.node);
}

Stmt clone(const Stmt& s) {
    if (const auto* v = std::get_if<VarDecl>(&s.node)) {
        return Stmt{VarDecl{v->name, clone(*v->value)}};
    }
    if (const auto* f = std::get_if<FnDecl>(&s.node)) {
        return Stmt{FnDecl{f->name, f->params, clone(*f->body)}};
    }
    return Stmt{ExprStmt{clone(*std::get<ExprStmt>(s.node).expr)}};
}

ExprPtr substitute_var(const Expr& expr, std::string_view name, const Expr& replacement) {
    return Substituter{name, replacement}.apply(expr);
}

std::set<std::string> referenced_vars(const Expr& expr) {
    std::set<std::string> out;
    VarCollector{out}.apply(expr);
    return out;
}

std::string to_string(const Expr& e) {
    return std::visit(Printer{}, e.node);
}

std::string to_string(const Stmt& s) {
    if (const auto* v = std::get_if<VarDecl>(&s.node)) {
        return "(let " + v->name + " " + to_string(*v->value) + ")";
    }
    if (const auto* f = std::get_if<FnDecl>(&s.node)) {
        std::string params;
        for (const auto& p : f->params) {
            if (!params.empty()) params += " ";
            params += p;
        }
        return "(fn " + f->name + " (" + params + ") " + to_string(*f->body) + ")";
    }
    return to_string(*std::get<ExprStmt>(s.node).expr);
}

} // namespace calcexpr
