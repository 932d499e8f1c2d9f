// Scope is one activation: which function is running, and which variable store it reads and writes.
// WhileLoop and IfElse run in the Scope they were handed; dumblang has no block scoping.
#pragma once
#include <defs.h>
#include <runtime/core.hpp>
#include <map>
#include <string>


typedef std::map<std::string, ObjectRef> VariableStore;


struct Scope {
    Evaluator* evaluator;
    const Function* function;
    VariableStore& store;

    Scope(Evaluator* e, const Function* f, VariableStore& s) : evaluator(e), function(f), store(s) {}

    ObjectRef lookup(const std::string& name, int line); // throws a Name error if the variable was never written

    void assign(const std::string& name, ObjectRef value);
};
