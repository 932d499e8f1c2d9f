#include <types/Block.hpp>
#include <stdio.h>


Block::Block(int line) : Node(BLOCK, line) {}

Flow Block::exec(Scope& scope) const {
    for (Statement* statement : statements) {
        Flow flow = statement -> exec(scope);
        if (flow.returned) { // a return anywhere below us ends the whole activation, not just this block
            return flow;
        }
    }
    return Flow::next();
}

void Block::emit(LuaWriter* out, int indent) const {
    for (Statement* statement : statements) {
        statement -> emitStatement(out, indent);
    }
}

void Block::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Block\n");
    for (Statement* statement : statements) {
        statement -> pTree(tabLevel + 1);
    }
}
