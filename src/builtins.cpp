// the default builtins. Each one is a closure over the console it talks to, so a host can point them anywhere.
#include <evaluator.hpp>
#include <errors.hpp>
#include <luawriter.hpp>
#include <runtime/types.hpp>
#include <util.hpp>
#include <math.h>
#include <stdlib.h>


static std::string readLine(WriteOutput& console, FILE* input) {
    console.flush(); // the prompt has to be out before we block
    char* buffer = NULL;
    size_t capacity = 0;
    ssize_t got = getline(&buffer, &capacity, input);
    if (got < 0) {
        free(buffer);
        throw DslError(DslError::Host, "end of input");
    }
    std::string line(buffer, got);
    free(buffer);
    if (line.size() > 0 && line[line.size() - 1] == '\n') {
        line.pop_back();
    }
    if (line.size() > 0 && line[line.size() - 1] == '\r') {
        line.pop_back();
    }
    return line;
}


BuiltinTable defaultBuiltins(WriteOutput& console, FILE* input, RunFlags flags) {
    BuiltinTable table;
    table["print"] = [&console](ObjectRef value) {
        console.write("DSL> " + value -> toString() + "\n");
        return makeNone();
    };
    table["inpstr"] = [&console, input, flags](ObjectRef) {
        if (flags.prompts) {
            console.write("DSL<(str)\n");
        }
        return makeString(readLine(console, input));
    };
    table["inpnum"] = [&console, input, flags](ObjectRef) {
        if (flags.prompts) {
            console.write("DSL<(num)\n");
        }
        std::string line = readLine(console, input);
        double number;
        if (!parseNumber(line, &number)) {
            throw DslError(DslError::Host, "could not parse '" + line + "' as a number");
        }
        return makeNumber(number);
    };
    table["sqrt"] = [](ObjectRef value) {
        if (value -> type != RuntimeObject::Number) {
            throw DslError(DslError::Type, std::string("sqrt wants a number, not '") + RuntimeObject::typeName(value -> type) + "'");
        }
        double x = ((NumberObject*)value.get()) -> content;
        if (x < 0) {
            throw DslError(DslError::Host, "math domain error");
        }
        return makeNumber(sqrt(x));
    };
    return table;
}
