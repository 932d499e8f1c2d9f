#include <types/FunctionCall.hpp>
#include <evaluator.hpp>
#include <luawriter.hpp>
#include <stdio.h>


FunctionCall::FunctionCall(int line, std::string n, Expr* arg) : Expr(CALL, line), name(n), argument(arg) {}

ObjectRef FunctionCall::eval(Scope& scope) const {
    return scope.evaluator -> call(name, argument, scope, line);
}

std::string FunctionCall::emit(LuaWriter* out) const {
    if (argument == NULL) {
        return out -> function(name) + "()";
    }
    return out -> function(name) + "(" + argument -> emit(out) + ")";
}

void FunctionCall::emitStatement(LuaWriter* out, int indent) const { // a call is already a valid Lua statement
    out -> line(indent, emit(out));
}

void FunctionCall::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Call to %s\n", name.c_str());
    if (argument != NULL) {
        argument -> pTree(tabLevel + 1);
    }
}
