#pragma once
#include <node.hpp>
#include <vector>


struct Array : Expr { // array literal. every evaluation builds a fresh array
    std::vector<Expr*> elements;

    Array(int line);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;
};
