#include <types/IfElse.hpp>
#include <types/Block.hpp>
#include <luawriter.hpp>
#include <stdio.h>


IfElse::IfElse(int line, Expr* c, Block* m, Block* e) : Statement(IFELSE, line), condition(c), mainBlock(m), elseBlock(e) {}

Flow IfElse::exec(Scope& scope) const {
    if (condition -> eval(scope) -> truthyness()) {
        return mainBlock -> exec(scope);
    }
    return elseBlock -> exec(scope);
}

void IfElse::emitStatement(LuaWriter* out, int indent) const {
    out -> line(indent, "if truthy(" + condition -> emit(out) + ") then");
    mainBlock -> emit(out, indent + 1);
    out -> line(indent, "else");
    elseBlock -> emit(out, indent + 1);
    out -> line(indent, "end");
}

void IfElse::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("If\n");
    condition -> pTree(tabLevel + 1);
    mainBlock -> pTree(tabLevel + 1);
    tabs(tabLevel);
    printf("Else\n");
    elseBlock -> pTree(tabLevel + 1);
}
