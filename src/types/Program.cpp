#include <types/Program.hpp>
#include <types/Function.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Program::Program(int line) : Node(PROGRAM, line) {}

Program::~Program() {
    for (Node* node : nodes) {
        delete node;
    }
}

Function* Program::find(std::string name) {
    for (Function* f : functions) {
        if (f -> name == name) {
            return f;
        }
    }
    return NULL;
}

void Program::emit(LuaWriter* out) const {
    out -> prelude();
    for (Function* f : functions) {
        f -> emit(out);
        out -> line(0, "");
    }
    out -> trailer();
}

void Program::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Program with %zu functions\n", functions.size());
    for (Function* f : functions) {
        f -> pTree(tabLevel + 1);
    }
}
