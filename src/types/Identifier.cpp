#include <types/Identifier.hpp>
#include <scope.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Identifier::Identifier(int line, std::string n) : Expr(IDENTIFIER, line), name(n) {}

ObjectRef Identifier::eval(Scope& scope) const {
    return scope.lookup(name, line);
}

std::string Identifier::emit(LuaWriter* out) const {
    return out -> variable(name);
}

void Identifier::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Identifier %s\n", name.c_str());
}
