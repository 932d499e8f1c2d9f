#include <types/Expression.hpp>
#include <types/Identifier.hpp>
#include <types/ArrAcc.hpp>
#include <runtime/types.hpp>
#include <errors.hpp>
#include <scope.hpp>
#include <luawriter.hpp>
#include <math.h>
#include <stdio.h>


Expression::Expression(int line, Expr* l, Op o, Expr* r) : Expr(EXPRESSION, line), op(o), left(l), right(r) {}

const char* Expression::symbol(Op o) {
    switch (o) {
        case ADD: return "+";
        case SUB: return "-";
        case MUL: return "*";
        case DIV: return "/";
        case POW: return "^";
        case LT: return "<";
        case GT: return ">";
        case EQ: return "==";
        case ASSIGN: return "=";
    }
    return "?";
}

static DslError badOperands(Expression::Op op, ObjectRef one, ObjectRef two, int line) {
    return DslError(DslError::Type, std::string("unsupported operand types for ") + Expression::symbol(op) + ": '"
        + RuntimeObject::typeName(one -> type) + "' and '" + RuntimeObject::typeName(two -> type) + "'", line);
}

ObjectRef Expression::apply(Op o, ObjectRef one, ObjectRef two, int line) {
    if (o == EQ) {
        return makeBoolean(one -> equals(two.get()));
    }
    if (one -> type == RuntimeObject::Number && two -> type == RuntimeObject::Number) {
        double a = ((NumberObject*)one.get()) -> content;
        double b = ((NumberObject*)two.get()) -> content;
        switch (o) {
            case ADD: return makeNumber(a + b);
            case SUB: return makeNumber(a - b);
            case MUL: return makeNumber(a * b);
            case DIV:
                if (b == 0) {
                    throw DslError(DslError::Runtime, "division by zero", line);
                }
                return makeNumber(floor(a / b)); // dumblang division is floor division
            case POW: return makeNumber(pow(a, b));
            case LT: return makeBoolean(a < b);
            case GT: return makeBoolean(a > b);
            default: break;
        }
    }
    else if (one -> type == RuntimeObject::String && two -> type == RuntimeObject::String) {
        std::string& a = ((StringObject*)one.get()) -> content;
        std::string& b = ((StringObject*)two.get()) -> content;
        switch (o) {
            case ADD: return makeString(a + b);
            case LT: return makeBoolean(a < b);
            case GT: return makeBoolean(a > b);
            default: break;
        }
    }
    else if (o == ADD && one -> type == RuntimeObject::Array && two -> type == RuntimeObject::Array) { // a fresh array, neither side is touched
        std::vector<ObjectRef> joined = ((ArrayObject*)one.get()) -> content;
        std::vector<ObjectRef>& tail = ((ArrayObject*)two.get()) -> content;
        joined.insert(joined.end(), tail.begin(), tail.end());
        return makeArray(joined);
    }
    throw badOperands(o, one, two, line);
}

ObjectRef Expression::assign(Scope& scope) const { // the target's shape decides what kind of write this is; it is never evaluated as a value itself
    if (left -> type == IDENTIFIER) {
        ObjectRef value = right -> eval(scope);
        scope.assign(((Identifier*)left) -> name, value);
        return value;
    }
    if (left -> type == ARRACC) {
        ArrAcc* target = (ArrAcc*)left;
        ObjectRef container = target -> array -> eval(scope);
        ObjectRef idx = target -> index -> eval(scope);
        ObjectRef value = right -> eval(scope);
        ArrAcc::write(container, idx, value, line);
        return value;
    }
    throw DslError(DslError::Type, "can only assign to a variable or an array element", line);
}

ObjectRef Expression::eval(Scope& scope) const {
    if (op == ASSIGN) {
        return assign(scope);
    }
    ObjectRef one = left -> eval(scope);
    ObjectRef two = right -> eval(scope);
    return apply(op, one, two, line);
}

std::string Expression::emit(LuaWriter* out) const {
    std::string l = left -> emit(out);
    std::string r = right -> emit(out);
    switch (op) {
        case ADD: return "add(" + l + ", " + r + ")";
        case DIV: return "idiv(" + l + ", " + r + ")";
        case EQ: return "eq(" + l + ", " + r + ")";
        case ASSIGN:
            throw DslError(DslError::Backend, "an assignment can't be used as a value in Lua", line);
        default:
            return "(" + l + " " + symbol(op) + " " + r + ")";
    }
}

void Expression::emitStatement(LuaWriter* out, int indent) const {
    if (op != ASSIGN) {
        Expr::emitStatement(out, indent);
        return;
    }
    if (left -> type == IDENTIFIER) {
        out -> line(indent, out -> variable(((Identifier*)left) -> name) + " = " + right -> emit(out));
    }
    else if (left -> type == ARRACC) {
        ArrAcc* target = (ArrAcc*)left;
        out -> line(indent, "seti(" + target -> array -> emit(out) + ", " + target -> index -> emit(out) + ", " + right -> emit(out) + ")");
    }
    else {
        throw DslError(DslError::Backend, "can only assign to a variable or an array element", line);
    }
}

void Expression::pTree(int tabLevel) const {
    tabs(tabLevel);
    printf("Expression %s\n", symbol(op));
    left -> pTree(tabLevel + 1);
    right -> pTree(tabLevel + 1);
}
