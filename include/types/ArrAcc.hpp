#pragma once
#include <node.hpp>
#include <cstddef>


struct ArrAcc : Expr { // array[index]. As the left side of an assignment it's an element write instead of a read
    Expr* array;
    Expr* index;

    ArrAcc(int line, Expr* a, Expr* i);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void pTree(int tabLevel = 0) const;

    static ObjectRef read(ObjectRef container, ObjectRef idx, int line);

    static void write(ObjectRef container, ObjectRef idx, ObjectRef value, int line);

    static size_t resolve(size_t size, ObjectRef idx, int line); // truncate toward zero, negative counts from the end, bounds check
};
