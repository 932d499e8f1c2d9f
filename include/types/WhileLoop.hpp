#pragma once
#include <node.hpp>


struct WhileLoop : Statement {
    Expr* condition;
    Block* body;

    WhileLoop(int line, Expr* c, Block* b);

    Flow exec(Scope& scope) const;

    void emitStatement(LuaWriter* out, int indent) const;

    void pTree(int tabLevel = 0) const;
};
