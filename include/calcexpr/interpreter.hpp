#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "calcexpr/ast.hpp"
#include "calcexpr/errors.hpp"
#include "calcexpr/number.hpp"
#include "calcexpr/prelude.hpp"
#include "calcexpr/symbol_table.hpp"

namespace calcexpr {

enum class AngleUnit { Radians, Degrees };

namespace detail {

constexpr int kMaxDepth = 256;

class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) {
        if (depth_ >= kMaxDepth) throw EvalError("Maximum recursion depth exceeded");
        ++depth_;
    }
    ~DepthGuard() { --depth_; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth_;
};

template <class Frame>
class ScopeGuard {
public:
    ScopeGuard(std::vector<Frame>& scopes, Frame frame) : scopes_(scopes) {
        scopes_.push_back(std::move(frame));
    }
    ~ScopeGuard() { scopes_.pop_back(); }

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
    std::vector<Frame>& scopes_;
};

template <class M>
M modulus(const BasicNumber<M>& z) {
    return (z.real * z.real + z.imaginary * z.imaginary).sqrt();
}

// sqrt that absorbs tiny negative rounding residue.
template <class M>
M sqrt_nonneg(const M& x) {
    return x < M(0.0) ? M(0.0) : x.sqrt();
}

template <class M>
BasicNumber<M> negate(const BasicNumber<M>& a) {
    return {-a.real, -a.imaginary, a.unit};
}

template <class M>
BasicNumber<M> add(const BasicNumber<M>& a, const BasicNumber<M>& b) {
    return {a.real + b.real, a.imaginary + b.imaginary};
}

template <class M>
BasicNumber<M> sub(const BasicNumber<M>& a, const BasicNumber<M>& b) {
    return {a.real - b.real, a.imaginary - b.imaginary};
}

template <class M>
BasicNumber<M> mul(const BasicNumber<M>& a, const BasicNumber<M>& b) {
    return {a.real * b.real - a.imaginary * b.imaginary,
            a.real * b.imaginary + a.imaginary * b.real};
}

template <class M>
BasicNumber<M> div(const BasicNumber<M>& a, const BasicNumber<M>& b) {
    const M zero(0.0);
    if (b.imaginary == zero) {
        if (b.real == zero) throw EvalError("Division by zero");
        return {a.real / b.real, a.imaginary / b.real};
    }
    const M denom = b.real * b.real + b.imaginary * b.imaginary;
    return {(a.real * b.real + a.imaginary * b.imaginary) / denom,
            (a.imaginary * b.real - a.real * b.imaginary) / denom};
}

template <class M>
BasicNumber<M> complex_sqrt(const BasicNumber<M>& z) {
    const M zero(0.0);
    if (z.imaginary == zero) {
        if (z.real < zero) return {zero, (-z.real).sqrt()};
        return {z.real.sqrt(), zero};
    }
    const M r = modulus(z);
    const M two(2.0);
    const M re = sqrt_nonneg((r + z.real) / two);
    const M im = sqrt_nonneg((r - z.real) / two);
    return {re, z.imaginary < zero ? -im : im};
}

template <class M>
BasicNumber<M> pow(const BasicNumber<M>& base, const BasicNumber<M>& exponent) {
    const M zero(0.0);
    if (exponent.imaginary != zero) throw EvalError("Complex exponents are not supported");
    const M& y = exponent.real;

    if (base.imaginary == zero) {
        const M& x = base.real;
        if (x == zero && y < zero) throw EvalError("Division by zero");
        if (x < zero && !y.is_integer()) {
            // principal value: |x|^y * (cos(πy) + i sin(πy))
            const M r = x.abs().pow(y);
            const M angle = M::pi() * y;
            return {r * angle.cos(), r * angle.sin()};
        }
        return {x.pow(y), zero};
    }

    if (!y.is_integer() || y.abs() > M(1024.0)) {
        throw EvalError("Complex bases need an integer exponent of at most 1024");
    }
    auto n = static_cast<unsigned>(y.abs().to_double());
    BasicNumber<M> result{M(1.0)};
    BasicNumber<M> factor{base.real, base.imaginary};
    while (n > 0) {
        if (n & 1u) result = mul(result, factor);
        factor = mul(factor, factor);
        n >>= 1;
    }
    if (y < zero) result = div(BasicNumber<M>{M(1.0)}, result);
    return result;
}

} // namespace detail

/// Evaluates parsed statements over magnitude type M.
///
/// Variable declarations are stored in the symbol table and re-evaluated on
/// every reference; function declarations are registered by the parser.
/// Throws EvalError on unknown names, arity mismatches, division by zero and
/// runaway recursion.
template <class M>
class Interpreter {
public:
    using Value = BasicNumber<M>;

    Interpreter(AngleUnit angle_unit, SymbolTable& symbol_table)
        : angle_unit_(angle_unit), symbol_table_(symbol_table) {}

    /// Value of the last statement; nothing for a trailing function
    /// declaration or an empty program.
    std::optional<Value> interpret(const std::vector<Stmt>& statements) {
        std::optional<Value> last;
        for (const auto& stmt : statements) last = eval_stmt(stmt);
        return last;
    }

    Value eval(const Expr& expr) {
        if (const auto* b = std::get_if<BinaryExpr>(&expr.node)) return eval_binary(*b);
        if (const auto* u = std::get_if<UnaryExpr>(&expr.node)) {
            if (u->op != TokKind::Minus) throw EvalError(std::string("Unsupported unary operator: ") + to_string(u->op));
            return detail::negate(eval(*u->operand));
        }
        if (const auto* u = std::get_if<UnitExpr>(&expr.node)) {
            Value v = eval(*u->operand);
            v.unit = to_string(u->unit);
            return v;
        }
        if (const auto* v = std::get_if<VarExpr>(&expr.node)) return eval_var(v->name);
        if (const auto* g = std::get_if<GroupExpr>(&expr.node)) return eval(*g->inner);
        if (const auto* c = std::get_if<CallExpr>(&expr.node)) return eval_call(*c);
        return Value{M::parse(std::get<LiteralExpr>(expr.node).text)};
    }

private:
    using Frame = std::map<std::string, Value>;

    std::optional<Value> eval_stmt(const Stmt& stmt) {
        if (const auto* decl = std::get_if<VarDecl>(&stmt.node)) {
            Value value = eval(*decl->value);
            if (const VarDecl* previous = symbol_table_.get_var(decl->name)) {
                symbol_table_.declare(VarDecl{decl->name, detach(*decl, *previous)});
            } else {
                symbol_table_.declare(*decl);
            }
            return value;
        }
        if (std::holds_alternative<FnDecl>(stmt.node)) return std::nullopt;
        return eval(*std::get<ExprStmt>(stmt.node).expr);
    }

    // True if `var` is `name` or its stored definition leads to `name`
    // through other variables.
    bool reaches(const std::string& var, const std::string& name, std::set<std::string>& seen) const {
        if (var == name) return true;
        if (!seen.insert(var).second) return false;
        const VarDecl* decl = symbol_table_.get_var(var);
        if (!decl) return false;
        for (const auto& v : referenced_vars(*decl->value)) {
            if (reaches(v, name, seen)) return true;
        }
        return false;
    }

    // A redeclaration refers to the previous definition of its own name,
    // directly ("x = x + 1") or through other variables ("a = b" with
    // "b = a"). Variables on such a path are inlined first, then the name
    // itself is replaced, so stored definitions never form a cycle.
    ExprPtr detach(const VarDecl& decl, const VarDecl& previous) const {
        ExprPtr value = clone(*decl.value);
        for (bool changed = true; changed;) {
            changed = false;
            for (const auto& v : referenced_vars(*value)) {
                std::set<std::string> seen;
                if (v == decl.name || !reaches(v, decl.name, seen)) continue;
                value = substitute_var(*value, v, *symbol_table_.get_var(v)->value);
                changed = true;
                break;
            }
        }
        return substitute_var(*value, decl.name, *previous.value);
    }

    Value eval_binary(const BinaryExpr& b) {
        Value left = eval(*b.left);
        Value right = eval(*b.right);
        Value result;
        switch (b.op) {
            case TokKind::Plus:  result = detail::add(left, right); break;
            case TokKind::Minus: result = detail::sub(left, right); break;
            case TokKind::Star:  result = detail::mul(left, right); break;
            case TokKind::Slash: result = detail::div(left, right); break;
            case TokKind::Power: result = detail::pow(left, right); break;
            default:
                throw EvalError(std::string("Unsupported operator: ") + to_string(b.op));
        }
        result.unit = left.unit.empty() ? right.unit : left.unit;
        return result;
    }

    Value eval_var(const std::string& name) {
        if (!scopes_.empty()) {
            auto it = scopes_.back().find(name);
            if (it != scopes_.back().end()) return it->second;
        }

        if (const VarDecl* decl = symbol_table_.get_var(name)) {
            // Declared values see globals only, never the caller's parameters.
            detail::DepthGuard depth(depth_);
            detail::ScopeGuard<Frame> scope(scopes_, Frame{});
            return eval(*decl->value);
        }

        if (name == "pi") return Value{M::pi()};
        if (name == "e") return Value{M::e()};
        if (name == "tau") return Value{M::pi() * M(2.0)};
        if (name == "phi") return Value{(M(1.0) + M(5.0).sqrt()) / M(2.0)};
        if (name == "i") return Value{M(0.0), M(1.0)};

        throw EvalError("Unknown variable: " + name);
    }

    Value eval_call(const CallExpr& call) {
        std::vector<Value> args;
        args.reserve(call.args.size());
        for (const auto& a : call.args) args.push_back(eval(*a));

        if (const FnDecl* fn = symbol_table_.get_fn(call.name)) {
            if (fn->params.size() != args.size()) {
                throw EvalError(call.name + " expects " + std::to_string(fn->params.size()) +
                                " argument(s), got " + std::to_string(args.size()));
            }
            Frame frame;
            for (std::size_t i = 0; i < args.size(); ++i) frame.insert_or_assign(fn->params[i], std::move(args[i]));

            detail::DepthGuard depth(depth_);
            detail::ScopeGuard<Frame> scope(scopes_, std::move(frame));
            return eval(*fn->body);
        }

        if (auto builtin = find_builtin(call.name)) {
            if (arity(*builtin) != args.size()) {
                throw EvalError(call.name + " expects " + std::to_string(arity(*builtin)) +
                                " argument(s), got " + std::to_string(args.size()));
            }
            return call_builtin(*builtin, call.name, args);
        }

        throw EvalError("Unknown function: " + call.name);
    }

    Value call_builtin(Builtin fn, const std::string& name, const std::vector<Value>& args) {
        const M zero(0.0);
        const Value& x = args[0];

        switch (fn) {
            case Builtin::Abs:  return Value{detail::modulus(x)};
            case Builtin::Sqrt: return detail::complex_sqrt(x);
            case Builtin::Re:   return Value{x.real};
            case Builtin::Im:   return Value{x.imaginary};
            default: break;
        }

        for (const auto& a : args) {
            if (a.has_imaginary()) throw EvalError(name + " does not accept complex arguments");
        }
        const M& v = x.real;

        switch (fn) {
            case Builtin::Cbrt: return Value{v.cbrt()};
            case Builtin::Exp:  return Value{v.exp()};
            case Builtin::Ln:
            case Builtin::Log:
                if (!(zero < v)) throw EvalError(name + " is only defined for positive numbers");
                return Value{fn == Builtin::Ln ? v.ln() : v.log10()};
            case Builtin::Sin:  return Value{to_radians(x).sin()};
            case Builtin::Cos:  return Value{to_radians(x).cos()};
            case Builtin::Tan:  return Value{to_radians(x).tan()};
            case Builtin::Asin: return Value{from_radians(v.asin())};
            case Builtin::Acos: return Value{from_radians(v.acos())};
            case Builtin::Atan: return Value{from_radians(v.atan())};
            case Builtin::Sinh: return Value{v.sinh()};
            case Builtin::Cosh: return Value{v.cosh()};
            case Builtin::Tanh: return Value{v.tanh()};
            case Builtin::Floor: return Value{v.floor()};
            case Builtin::Ceil:  return Value{v.ceil()};
            case Builtin::Round: return Value{v.round()};
            case Builtin::Trunc: return Value{v.trunc()};
            case Builtin::Fract: return Value{v.fract()};
            case Builtin::Max:   return Value{v < args[1].real ? args[1].real : v};
            case Builtin::Min:   return Value{args[1].real < v ? args[1].real : v};
            default: break;
        }
        throw EvalError("Unsupported function: " + name);
    }

    // A "deg"/"rad" tag wins over the session's angle unit.
    M to_radians(const Value& v) const {
        const bool degrees = v.unit == "deg" || (v.unit.empty() && angle_unit_ == AngleUnit::Degrees);
        return degrees ? v.real * M::pi() / M(180.0) : v.real;
    }

    M from_radians(const M& radians) const {
        return angle_unit_ == AngleUnit::Degrees ? radians * M(180.0) / M::pi() : radians;
    }

    AngleUnit angle_unit_;
    SymbolTable& symbol_table_;
    std::vector<Frame> scopes_;
    int depth_{0};
};

} // namespace calcexpr
