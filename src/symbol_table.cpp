#include "calcexpr/symbol_table.hpp"
#include "calcexpr/prelude.hpp"

namespace calcexpr {

void SymbolTable::declare(const VarDecl& decl) {
    table_.insert_or_assign(decl.name, Stmt{VarDecl{decl.name, clone(*decl.value)}});
}

void SymbolTable::declare(const FnDecl& decl) {
    table_.insert_or_assign(fn_key(decl.name), Stmt{FnDecl{decl.name, decl.params, clone(*decl.body)}});
}

const VarDecl* SymbolTable::get_var(std::string_view name) const {
    auto it = table_.find(name);
    if (it == table_.end()) return nullptr;
    return std::get_if<VarDecl>(&it->second.node);
}

const FnDecl* SymbolTable::get_fn(std::string_view name) const {
    auto it = table_.find(fn_key(name));
    if (it == table_.end()) return nullptr;
    return std::get_if<FnDecl>(&it->second.node);
}

bool SymbolTable::contains_fn(std::string_view name) const {
    return get_fn(name) != nullptr || is_builtin_function(name);
}

} // namespace calcexpr
