// Evaluator runs a parsed Program. One Evaluator is one run context: its function table is fixed at construction, and it owns the
// variable stores. Evaluators share nothing, so separate runs (or separate threads) just need separate Evaluators.
#pragma once
#include <defs.h>
#include <runflags.h>
#include <scope.hpp>
#include <runtime/core.hpp>
#include <functional>
#include <map>
#include <string>
#include <stdio.h>


typedef std::function<ObjectRef(ObjectRef)> Builtin; // gets a none object when called without an argument
typedef std::map<std::string, Builtin> BuiltinTable;


struct Evaluator {
    Program* program;
    RunFlags flags;
    BuiltinTable builtins;
    std::map<std::string, const Function*> functions;
    std::map<std::string, VariableStore> stores; // one per function name. unused when flags.frames is on
    int depth = 0; // current user-function nesting

    Evaluator(Program* p, BuiltinTable table, RunFlags fl = RunFlags());

    ObjectRef run(ObjectRef entry); // run main with entry bound to its parameter. returns main's value, or none

    ObjectRef call(const std::string& name, const Expr* argument, Scope& caller, int line); // user functions first, then builtins

    ObjectRef invoke(const Function* function, ObjectRef argument, bool hasArgument, int line);
};


// print, inpstr, inpnum, sqrt. console is where print and the prompts go; input is where inpstr and inpnum read lines from.
BuiltinTable defaultBuiltins(WriteOutput& console, FILE* input, RunFlags flags = RunFlags());
