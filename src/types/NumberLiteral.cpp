#include <types/NumberLiteral.hpp>
#include <runtime/types.hpp>
#include <luawriter.hpp>
#include <util.hpp>
#include <stdio.h>


NumberLiteral::NumberLiteral(int line, double v) : Expr(NUMBER, line), value(v), object(makeNumber(v)) {}

ObjectRef NumberLiteral::eval(Scope& scope) const {
    return object;
}

std::string NumberLiteral::emit(LuaWriter* out) const {
    return out -> number(value);
}

void NumberLiteral::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Number %s\n", formatNumber(value).c_str());
}
