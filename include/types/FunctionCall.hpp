#pragma once
#include <node.hpp>
#include <string>


struct FunctionCall : Expr {
    std::string name;
    Expr* argument; // NULL for name()

    FunctionCall(int line, std::string n, Expr* arg);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void emitStatement(LuaWriter* out, int indent) const;

    void pTree(int tabLevel = 0) const;
};
