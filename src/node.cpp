#include <node.hpp>
#include <luawriter.hpp>
#include <stdio.h>


Flow Flow::next() {
    return Flow();
}

Flow Flow::ret(ObjectRef value) {
    Flow f;
    f.returned = true;
    f.value = value;
    return f;
}

Node::~Node() {}

void Node::tabs(int tabLevel) {
    for (int x = 0; x < tabLevel; x ++) {printf("\t");}
}

Flow Expr::exec(Scope& scope) const {
    eval(scope);
    return Flow::next();
}

void Expr::emitStatement(LuaWriter* out, int indent) const { // Lua won't take a bare expression as a statement
    out -> line(indent, "discard(" + emit(out) + ")");
}
