#pragma once
#include <defs.h>
#include <runtime/core.hpp>
#include <string>


struct Flow { // what running a statement tells whoever ran it: carry on, or the function is done and here's its value
    bool returned = false;
    ObjectRef value;

    static Flow next();

    static Flow ret(ObjectRef value);
};


struct Node { // superclass. Nodes are built once by the Parser and never change after that; everything that walks them gets a const view
    virtual ~Node();

    enum Type {
        PROGRAM,
        FUNCTION,
        BLOCK,
        IDENTIFIER,
        NUMBER,
        STRING,
        ARRAY,
        EXPRESSION,
        CALL,
        ARRACC,
        WHILE,
        IFELSE,
        RETURN
    } type;
    int line; // line of the first token

    Node(Type t, int l) : type(t), line(l) {}

    virtual void pTree(int tabLevel = 0) const = 0;

    static void tabs(int tabLevel);
};


struct Statement : Node { // anything that can sit in a Block
    Statement(Type t, int l) : Node(t, l) {}

    virtual Flow exec(Scope& scope) const = 0;

    virtual void emitStatement(LuaWriter* out, int indent) const = 0;
};


struct Expr : Statement { // anything that produces a value
    Expr(Type t, int l) : Statement(t, l) {}

    virtual ObjectRef eval(Scope& scope) const = 0;

    virtual std::string emit(LuaWriter* out) const = 0; // render as a Lua expression

    Flow exec(Scope& scope) const; // expression statements: evaluate for side effects, drop the value

    void emitStatement(LuaWriter* out, int indent) const;
};
