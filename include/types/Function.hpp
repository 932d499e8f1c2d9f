#pragma once
#include <node.hpp>
#include <string>


struct Function : Node {
    std::string name;
    std::string param; // empty if the function doesn't take anything
    Block* body;

    Function(int line, std::string n, std::string p, Block* b);

    void emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
