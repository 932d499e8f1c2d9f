#include <types/Function.hpp>
#include <types/Block.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Function::Function(int line, std::string n, std::string p, Block* b) : Node(FUNCTION, line), name(n), param(p), body(b) {}

void Function::emit(LuaWriter* out) const {
    if (!out -> flags.frames) {
        out -> line(0, "V[" + out -> string(name) + "] = {}");
    }
    out -> line(0, out -> function(name) + " = function(arg)");
    if (out -> flags.frames) {
        out -> line(1, "local v = {}");
    }
    else {
        out -> line(1, "local v = V[" + out -> string(name) + "]");
    }
    if (param.size() > 0) {
        out -> line(1, out -> variable(param) + " = arg");
    }
    body -> emit(out, 1);
    out -> line(0, "end");
}

void Function::pTree(int tabLevel) const {
    tabs(tabLevel);
    if (param.size() > 0) {
        printf("Function %s(%s) on line %d\n", name.c_str(), param.c_str(), line);
    }
    else {
        printf("Function %s() on line %d\n", name.c_str(), line);
    }
    body -> pTree(tabLevel + 1);
}
