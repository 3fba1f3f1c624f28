#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include "calcexpr/ast.hpp"

namespace calcexpr {

/// Most recent declaration per name. Variables are keyed by their name,
/// functions by name + "()", so both may share a name.
/// The table keeps its own copies of the declarations it is given.
class SymbolTable {
public:
    void declare(const VarDecl& decl);
    void declare(const FnDecl& decl);

    const VarDecl* get_var(std::string_view name) const;
    const FnDecl* get_fn(std::string_view name) const;

    bool contains_var(std::string_view name) const { return get_var(name) != nullptr; }

    // True for user-declared functions and built-ins.
    bool contains_fn(std::string_view name) const;

private:
    static std::string fn_key(std::string_view name) { return std::string(name) + "()"; }

    std::map<std::string, Stmt, std::less<>> table_;
};

} // namespace calcexpr
