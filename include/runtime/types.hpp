// "type" DECLARATIONS for dumblang runtime values
#pragma once
#include <runtime/core.hpp>
#include <vector>
#include <set>
#include <utility>


struct NoneObject : RuntimeObject {
    NoneObject();

    bool equals(RuntimeObject*);

    std::string toString();

    bool truthyness();
};


struct StringObject : RuntimeObject {
    std::string content;

    StringObject(std::string data);

    bool equals(RuntimeObject* thing);

    std::string toString();

    bool truthyness();
};


struct NumberObject : RuntimeObject {
    double content;

    NumberObject(double data);

    bool equals(RuntimeObject* thing);

    std::string toString();

    bool truthyness();
};


struct BooleanObject : RuntimeObject {
    bool content;

    BooleanObject(bool value);

    bool equals(RuntimeObject* thing);

    std::string toString();

    bool truthyness();
};


struct ArrayObject : RuntimeObject {
    std::vector<ObjectRef> content; // mutated in place; every variable holding this array sees the change

    ArrayObject();

    ArrayObject(std::vector<ObjectRef> data);

    ~ArrayObject(); // iterative, so freeing a long chain of nested arrays doesn't eat the stack

    bool equals(RuntimeObject* thing);

    std::string toString();

    bool truthyness();

    constexpr static size_t MaxNesting = 5000; // toString and equals give up past this many levels

private:
    typedef std::set<std::pair<ArrayObject*, ArrayObject*>> Comparing;

    bool equals(ArrayObject* other, Comparing& comparing, size_t depth);

    std::string toString(std::vector<ArrayObject*>& open); // open: the arrays we're in the middle of printing
};


ObjectRef makeNone();

ObjectRef makeNumber(double value);

ObjectRef makeString(std::string value);

ObjectRef makeBoolean(bool value);

ObjectRef makeArray(std::vector<ObjectRef> elements);
