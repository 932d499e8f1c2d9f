#pragma once
#include <node.hpp>


struct Return : Expr { // parsed as an atom, but it only means something as a statement
    Expr* value; // NULL for a bare return

    Return(int line, Expr* v);

    Flow exec(Scope& scope) const;

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void emitStatement(LuaWriter* out, int indent) const;

    void pTree(int tabLevel = 0) const;
};
