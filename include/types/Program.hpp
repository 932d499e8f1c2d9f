#pragma once
#include <node.hpp>
#include <vector>
#include <string>


struct Program : Node {
    std::vector<Function*> functions;
    std::vector<Node*> nodes; // every node the parser allocated for this program. Program owns (and deletes) all of them

    Program(int line);

    ~Program();

    Function* find(std::string name); // NULL if there's no such function

    void emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
