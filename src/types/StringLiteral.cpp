#include <types/StringLiteral.hpp>
#include <runtime/types.hpp>
#include <luawriter.hpp>
#include <stdio.h>


StringLiteral::StringLiteral(int line, std::string v) : Expr(STRING, line), value(v), object(makeString(v)) {}

ObjectRef StringLiteral::eval(Scope& scope) const {
    return object;
}

std::string StringLiteral::emit(LuaWriter* out) const {
    return out -> string(value);
}

void StringLiteral::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("String \"%s\"\n", value.c_str());
}
