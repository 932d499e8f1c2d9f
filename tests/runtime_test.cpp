#include <gtest/gtest.h>
#include <runtime/types.hpp>
#include <types/Expression.hpp>
#include <types/ArrAcc.hpp>
#include <errors.hpp>
#include <util.hpp>
#include "harness.hpp"


TEST(RuntimeObject, ToString) {
    EXPECT_EQ(makeNumber(3) -> toString(), "3");
    EXPECT_EQ(makeNumber(2.5) -> toString(), "2.5");
    EXPECT_EQ(makeNumber(1e20) -> toString(), "1e+20");
    EXPECT_EQ(makeString("hi") -> toString(), "hi");
    EXPECT_EQ(makeNone() -> toString(), "none");
    EXPECT_EQ(makeBoolean(true) -> toString(), "true");
    EXPECT_EQ(makeBoolean(false) -> toString(), "false");
    EXPECT_EQ(makeArray({makeNumber(1), makeString("a"), makeArray({makeNumber(2)})}) -> toString(), "[1, \"a\", [2]]");
    EXPECT_EQ(makeArray({}) -> toString(), "[]");
}

TEST(RuntimeObject, SelfContainingArrayPrints) {
    ObjectRef a = makeArray({makeNumber(1)});
    ((ArrayObject*)a.get()) -> content.push_back(a);
    EXPECT_EQ(a -> toString(), "[1, [...]]");
    ((ArrayObject*)a.get()) -> content.clear(); // break the cycle so it gets freed
}

TEST(RuntimeObject, LongerCyclesPrint) {
    ObjectRef a = makeArray({makeNumber(0)});
    ObjectRef b = makeArray({a});
    ((ArrayObject*)a.get()) -> content[0] = b;
    EXPECT_EQ(a -> toString(), "[[[...]]]");
    EXPECT_EQ(b -> toString(), "[[[...]]]");
    ObjectRef shared = makeArray({makeNumber(1)});
    EXPECT_EQ(makeArray({shared, shared}) -> toString(), "[[1], [1]]"); // seen twice isn't a cycle
    ((ArrayObject*)a.get()) -> content.clear();
}

TEST(RuntimeObject, CyclicArraysCompare) {
    ObjectRef a = makeArray({makeNumber(0)});
    ((ArrayObject*)a.get()) -> content[0] = a;
    ObjectRef b = makeArray({makeNumber(0)});
    ((ArrayObject*)b.get()) -> content[0] = b;
    ObjectRef c = makeArray({makeNumber(0), makeNumber(1)});
    ((ArrayObject*)c.get()) -> content[0] = c;
    EXPECT_TRUE(a -> equals(b.get()));
    EXPECT_FALSE(a -> equals(c.get()));
    ((ArrayObject*)a.get()) -> content.clear();
    ((ArrayObject*)b.get()) -> content.clear();
    ((ArrayObject*)c.get()) -> content.clear();
}

TEST(RuntimeObject, DeepNesting) {
    ObjectRef one = makeArray({});
    ObjectRef two = makeArray({});
    for (int i = 0; i < 1000000; i ++) { // freeing these must not recurse a million levels
        one = makeArray({one});
        two = makeArray({two});
    }
    EXPECT_EQ(errorKind([&]() { one -> toString(); }), DslError::Runtime);
    EXPECT_EQ(errorKind([&]() { one -> equals(two.get()); }), DslError::Runtime);
    ObjectRef shallow = makeArray({});
    for (size_t i = 0; i < ArrayObject::MaxNesting; i ++) {
        shallow = makeArray({shallow});
    }
    EXPECT_EQ(shallow -> toString().size(), 2 * (ArrayObject::MaxNesting + 1));
}

TEST(RuntimeObject, Truthiness) {
    EXPECT_FALSE(makeNumber(0) -> truthyness());
    EXPECT_TRUE(makeNumber(-0.5) -> truthyness());
    EXPECT_FALSE(makeString("") -> truthyness());
    EXPECT_TRUE(makeString("0") -> truthyness());
    EXPECT_FALSE(makeArray({}) -> truthyness());
    EXPECT_TRUE(makeArray({makeNone()}) -> truthyness());
    EXPECT_FALSE(makeNone() -> truthyness());
    EXPECT_FALSE(makeBoolean(false) -> truthyness());
}

TEST(RuntimeObject, Equality) {
    EXPECT_TRUE(makeNumber(1) -> equals(makeNumber(1).get()));
    EXPECT_FALSE(makeNumber(1) -> equals(makeString("1").get()));
    EXPECT_FALSE(makeNumber(1) -> equals(makeBoolean(true).get()));
    EXPECT_TRUE(makeNone() -> equals(makeNone().get()));
    ObjectRef one = makeArray({makeNumber(1), makeArray({makeString("x")})});
    ObjectRef two = makeArray({makeNumber(1), makeArray({makeString("x")})});
    ObjectRef three = makeArray({makeNumber(1)});
    EXPECT_TRUE(one -> equals(two.get()));
    EXPECT_FALSE(one -> equals(three.get()));
}

TEST(Operators, Arithmetic) {
    EXPECT_EQ(Expression::apply(Expression::DIV, makeNumber(7), makeNumber(2), 1) -> toString(), "3");
    EXPECT_EQ(Expression::apply(Expression::DIV, makeNumber(-7), makeNumber(2), 1) -> toString(), "-4");
    EXPECT_EQ(Expression::apply(Expression::POW, makeNumber(2), makeNumber(10), 1) -> toString(), "1024");
    EXPECT_EQ(Expression::apply(Expression::SUB, makeNumber(1), makeNumber(3), 1) -> toString(), "-2");
    EXPECT_EQ(errorKind([]() { Expression::apply(Expression::DIV, makeNumber(1), makeNumber(0), 1); }), DslError::Runtime);
}

TEST(Operators, StringsAndArrays) {
    EXPECT_EQ(Expression::apply(Expression::ADD, makeString("ab"), makeString("cd"), 1) -> toString(), "abcd");
    EXPECT_EQ(Expression::apply(Expression::LT, makeString("abc"), makeString("abd"), 1) -> toString(), "true");
    ObjectRef left = makeArray({makeNumber(1)});
    ObjectRef joined = Expression::apply(Expression::ADD, left, makeArray({makeNumber(2)}), 1);
    EXPECT_EQ(joined -> toString(), "[1, 2]");
    EXPECT_EQ(left -> toString(), "[1]");
}

TEST(Operators, TypeErrors) {
    EXPECT_EQ(errorKind([]() { Expression::apply(Expression::ADD, makeNumber(1), makeString("a"), 1); }), DslError::Type);
    EXPECT_EQ(errorKind([]() { Expression::apply(Expression::MUL, makeString("a"), makeString("b"), 1); }), DslError::Type);
    EXPECT_EQ(errorKind([]() { Expression::apply(Expression::ADD, makeBoolean(true), makeNumber(1), 1); }), DslError::Type);
    EXPECT_EQ(errorKind([]() { Expression::apply(Expression::LT, makeArray({}), makeArray({}), 1); }), DslError::Type);
    EXPECT_EQ(Expression::apply(Expression::EQ, makeNumber(1), makeString("1"), 1) -> toString(), "false");
}

TEST(Indexing, Resolve) {
    EXPECT_EQ(ArrAcc::resolve(3, makeNumber(0), 1), 0u);
    EXPECT_EQ(ArrAcc::resolve(3, makeNumber(2.9), 1), 2u);
    EXPECT_EQ(ArrAcc::resolve(3, makeNumber(-1), 1), 2u);
    EXPECT_EQ(ArrAcc::resolve(3, makeNumber(-3), 1), 0u);
    EXPECT_EQ(ArrAcc::resolve(3, makeNumber(-0.5), 1), 0u); // truncated toward zero first
    EXPECT_EQ(errorKind([]() { ArrAcc::resolve(3, makeNumber(3), 1); }), DslError::Runtime);
    EXPECT_EQ(errorKind([]() { ArrAcc::resolve(3, makeNumber(-4), 1); }), DslError::Runtime);
    EXPECT_EQ(errorKind([]() { ArrAcc::resolve(0, makeNumber(0), 1); }), DslError::Runtime);
    EXPECT_EQ(errorKind([]() { ArrAcc::resolve(3, makeString("0"), 1); }), DslError::Type);
}

TEST(Indexing, ReadAndWrite) {
    EXPECT_EQ(ArrAcc::read(makeString("hello"), makeNumber(1), 1) -> toString(), "e");
    ObjectRef array = makeArray({makeNumber(1), makeNumber(2)});
    ArrAcc::write(array, makeNumber(-1), makeString("x"), 1);
    EXPECT_EQ(array -> toString(), "[1, \"x\"]");
    EXPECT_EQ(errorKind([]() { ArrAcc::write(makeString("abc"), makeNumber(0), makeString("x"), 1); }), DslError::Type);
    EXPECT_EQ(errorKind([]() { ArrAcc::read(makeNumber(5), makeNumber(0), 1); }), DslError::Type);
}

TEST(ParseNumber, DecimalOnly) {
    double x = 0;
    EXPECT_TRUE(parseNumber(" 12.5 ", &x));
    EXPECT_EQ(x, 12.5);
    EXPECT_TRUE(parseNumber("-3", &x));
    EXPECT_EQ(x, -3);
    EXPECT_TRUE(parseNumber("1e3", &x));
    EXPECT_EQ(x, 1000);
    EXPECT_FALSE(parseNumber("inf", &x));
    EXPECT_FALSE(parseNumber("-infinity", &x));
    EXPECT_FALSE(parseNumber("nan", &x));
    EXPECT_FALSE(parseNumber("0x10", &x));
    EXPECT_FALSE(parseNumber("1e999", &x));
    EXPECT_FALSE(parseNumber("12abc", &x));
    EXPECT_FALSE(parseNumber("   ", &x));
    EXPECT_EQ(x, 1000);
}

TEST(Errors, KindsAndLines) {
    DslError withLine(DslError::Runtime, "boom", 4);
    EXPECT_EQ(std::string(withLine.what()), "line 4: boom");
    EXPECT_EQ(withLine.message, "boom");
    DslError without(DslError::Host, "end of input");
    EXPECT_EQ(std::string(without.what()), "end of input");
    EXPECT_STREQ(DslError::kindName(DslError::Backend), "Backend");
}
