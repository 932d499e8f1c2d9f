#include <types/WhileLoop.hpp>
#include <types/Block.hpp>
#include <luawriter.hpp>
#include <stdio.h>


WhileLoop::WhileLoop(int line, Expr* c, Block* b) : Statement(WHILE, line), condition(c), body(b) {}

Flow WhileLoop::exec(Scope& scope) const {
    while (condition -> eval(scope) -> truthyness()) {
        Flow flow = body -> exec(scope);
        if (flow.returned) {
            return flow;
        }
    }
    return Flow::next();
}

void WhileLoop::emitStatement(LuaWriter* out, int indent) const {
    out -> line(indent, "while truthy(" + condition -> emit(out) + ") do");
    body -> emit(out, indent + 1);
    out -> line(indent, "end");
}

void WhileLoop::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("While loop\n");
    condition -> pTree(tabLevel + 1);
    body -> pTree(tabLevel + 1);
}
