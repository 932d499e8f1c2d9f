#pragma once
#include <node.hpp>
#include <string>


struct StringLiteral : Expr {
    std::string value;
    ObjectRef object;

    StringLiteral(int line, std::string v);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
