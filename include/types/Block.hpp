#pragma once
#include <node.hpp>
#include <vector>


struct Block : Node {
    std::vector<Statement*> statements;

    Block(int line);

    Flow exec(Scope& scope) const; // runs statements in order, stopping at the first one that returns

    void emit(LuaWriter* out, int indent) const;

    void pTree(int tabLevel = 0) const;
};
