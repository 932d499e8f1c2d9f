#include <types/ArrAcc.hpp>
#include <runtime/types.hpp>
#include <errors.hpp>
#include <luawriter.hpp>
#include <util.hpp>
#include <math.h>
#include <stdio.h>


ArrAcc::ArrAcc(int line, Expr* a, Expr* i) : Expr(ARRACC, line), array(a), index(i) {}

size_t ArrAcc::resolve(size_t size, ObjectRef idx, int line) {
    if (idx -> type != RuntimeObject::Number) {
        throw DslError(DslError::Type, std::string("indices must be numbers, not '") + RuntimeObject::typeName(idx -> type) + "'", line);
    }
    double raw = ((NumberObject*)idx.get()) -> content;
    double i = trunc(raw);
    if (i < 0) {
        i += (double)size;
    }
    if (!(i >= 0 && i < (double)size)) { // also catches nan
        throw DslError(DslError::Runtime, "index " + formatNumber(raw) + " out of range", line);
    }
    return (size_t)i;
}

ObjectRef ArrAcc::read(ObjectRef container, ObjectRef idx, int line) {
    if (container -> type == RuntimeObject::Array) {
        std::vector<ObjectRef>& content = ((ArrayObject*)container.get()) -> content;
        return content[resolve(content.size(), idx, line)];
    }
    if (container -> type == RuntimeObject::String) {
        std::string& content = ((StringObject*)container.get()) -> content;
        return makeString(std::string(1, content[resolve(content.size(), idx, line)]));
    }
    throw DslError(DslError::Type, std::string("'") + RuntimeObject::typeName(container -> type) + "' can't be indexed", line);
}

void ArrAcc::write(ObjectRef container, ObjectRef idx, ObjectRef value, int line) {
    if (container -> type != RuntimeObject::Array) {
        throw DslError(DslError::Type, std::string("'") + RuntimeObject::typeName(container -> type) + "' doesn't support element assignment", line);
    }
    std::vector<ObjectRef>& content = ((ArrayObject*)container.get()) -> content;
    content[resolve(content.size(), idx, line)] = value;
}

ObjectRef ArrAcc::eval(Scope& scope) const {
    ObjectRef container = array -> eval(scope);
    ObjectRef idx = index -> eval(scope);
    return read(container, idx, line);
}

std::string ArrAcc::emit(LuaWriter* out) const {
    return "at(" + array -> emit(out) + ", " + index -> emit(out) + ")";
}

void ArrAcc::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Array access\n");
    array -> pTree(tabLevel + 1);
    index -> pTree(tabLevel + 1);
}
