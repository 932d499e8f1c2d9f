#include <types/Return.hpp>
#include <runtime/types.hpp>
#include <errors.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Return::Return(int line, Expr* v) : Expr(RETURN, line), value(v) {}

Flow Return::exec(Scope& scope) const {
    if (value == NULL) {
        return Flow::ret(makeNone());
    }
    return Flow::ret(value -> eval(scope));
}

ObjectRef Return::eval(Scope& scope) const {
    throw DslError(DslError::Runtime, "return can only be used as a statement", line);
}

std::string Return::emit(LuaWriter* out) const {
    throw DslError(DslError::Backend, "return can only be used as a statement", line);
}

void Return::emitStatement(LuaWriter* out, int indent) const { // the do ... end lets a return sit in the middle of a Lua block
    if (value == NULL) {
        out -> line(indent, "do return end");
    }
    else {
        out -> line(indent, "do return " + value -> emit(out) + " end");
    }
}

void Return::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Return\n");
    if (value != NULL) {
        value -> pTree(tabLevel + 1);
    }
}
