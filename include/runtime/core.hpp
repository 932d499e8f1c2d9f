// core superclass for dumblang runtime values
#pragma once
#include <memory>
#include <string>


struct RuntimeObject { // Core base class for everything a dumblang program can hold in a variable
    enum Type : int {
        None    = 1,
        Number  = 2,
        String  = 4,
        Boolean = 8,
        Array   = 16
    } type; // bitbangable

    virtual ~RuntimeObject() {}

    virtual bool equals(RuntimeObject* obj) = 0;

    virtual std::string toString() = 0;

    virtual bool truthyness() = 0;

    static const char* typeName(Type t);
};


typedef std::shared_ptr<RuntimeObject> ObjectRef; // values are shared freely. only arrays are mutable, and sharing them is the point
