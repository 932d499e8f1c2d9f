#pragma once
#include <node.hpp>
#include <string>


struct Identifier : Expr {
    std::string name;

    Identifier(int line, std::string n);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
