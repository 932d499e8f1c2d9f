#include <types/Array.hpp>
#include <runtime/types.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Array::Array(int line) : Expr(ARRAY, line) {}

ObjectRef Array::eval(Scope& scope) const {
    std::vector<ObjectRef> values;
    values.reserve(elements.size());
    for (Expr* element : elements) {
        values.push_back(element -> eval(scope));
    }
    return makeArray(values);
}

std::string Array::emit(LuaWriter* out) const {
    std::string ret = "{";
    for (size_t i = 0; i < elements.size(); i ++) {
        if (i > 0) {
            ret += ", ";
        }
        ret += elements[i] -> emit(out);
    }
    return ret + "}";
}

void Array::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Array of %zu\n", elements.size());
    for (Expr* element : elements) {
        element -> pTree(tabLevel + 1);
    }
}
