#pragma once
#include <node.hpp>


struct Expression : Expr { // any binary operation, assignment included
    enum Op {
        ADD,
        SUB,
        MUL,
        DIV,    // floor division
        POW,
        LT,
        GT,
        EQ,
        ASSIGN
    } op;
    Expr* left;
    Expr* right;

    Expression(int line, Expr* l, Op o, Expr* r);

    ObjectRef eval(Scope& scope) const;

    std::string emit(LuaWriter* out) const;

    void emitStatement(LuaWriter* out, int indent) const; // assignments are only renderable as statements

    void pTree(int tabLevel = 0) const;

    static const char* symbol(Op o);

    static ObjectRef apply(Op o, ObjectRef one, ObjectRef two, int line); // everything except ASSIGN

private:
    ObjectRef assign(Scope& scope) const;
};
