#pragma once
#include <node.hpp>


struct NumberLiteral : Expr {
    double value;
    ObjectRef object; // numbers are immutable, so every evaluation can hand out the same one

    NumberLiteral(int line, double v);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
