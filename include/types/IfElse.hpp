#pragma once
#include <node.hpp>


struct IfElse : Statement {
    Expr* condition;
    Block* mainBlock;
    Block* elseBlock; // never NULL, dumblang insists on the else

    IfElse(int line, Expr* c, Block* m, Block* e);

    Flow exec(Scope& scope) const;

    void emitStatement(LuaWriter* out, int indent) const;

    void pTree(int tabLevel = 0) const;
};
