#include <evaluator.hpp>
#include <errors.hpp>
#include <node.hpp>
#include <runtime/types.hpp>
#include <types/Program.hpp>
#include <types/Function.hpp>
#include <types/Block.hpp>


struct DepthGuard { // keeps Evaluator::depth honest even when a call throws
    int& depth;

    DepthGuard(int& d) : depth(d) {
        depth ++;
    }

    ~DepthGuard() {
        depth --;
    }
};


Evaluator::Evaluator(Program* p, BuiltinTable table, RunFlags fl) : program(p), flags(fl), builtins(table) {
    for (Function* f : program -> functions) {
        functions[f -> name] = f;
    }
}

ObjectRef Evaluator::run(ObjectRef entry) {
    depth = 0;
    stores.clear();
    auto found = functions.find("main");
    if (found == functions.end()) { // the parser won't produce this, but a hand-built Program might
        throw DslError(DslError::Name, "Unknown function 'main'");
    }
    return invoke(found -> second, entry, true, found -> second -> line);
}

ObjectRef Evaluator::call(const std::string& name, const Expr* argument, Scope& caller, int line) {
    auto user = functions.find(name);
    if (user != functions.end()) {
        if (argument == NULL) {
            return invoke(user -> second, makeNone(), false, line);
        }
        ObjectRef value = argument -> eval(caller); // evaluated before the callee's store is touched
        return invoke(user -> second, value, true, line);
    }
    auto builtin = builtins.find(name);
    if (builtin != builtins.end()) {
        ObjectRef value = argument == NULL ? makeNone() : argument -> eval(caller);
        ObjectRef result = builtin -> second(value);
        if (!result) {
            return makeNone();
        }
        return result;
    }
    throw DslError(DslError::Name, "Unknown function '" + name + "'", line);
}

ObjectRef Evaluator::invoke(const Function* function, ObjectRef argument, bool hasArgument, int line) {
    if (hasArgument && function -> param.size() == 0) {
        throw DslError(DslError::Type, "function '" + function -> name + "' takes no argument", line);
    }
    if (depth >= flags.maxDepth) {
        throw DslError(DslError::Runtime, "maximum call depth (" + std::to_string(flags.maxDepth) + ") exceeded", line);
    }
    DepthGuard guard(depth);
    VariableStore frame;
    VariableStore& store = flags.frames ? frame : stores[function -> name];
    Scope scope(this, function, store);
    if (function -> param.size() > 0) {
        scope.assign(function -> param, argument);
    }
    Flow flow = function -> body -> exec(scope);
    if (flow.returned && flow.value) {
        return flow.value;
    }
    return makeNone();
}
