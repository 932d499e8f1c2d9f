// shared test plumbing: a console that captures into a string, and scripted input lines
#pragma once
#include <gtest/gtest.h>
#include <dumblang.hpp>
#include <functional>
#include <memory>
#include <stdio.h>
#include <string>


struct Harness {
    std::string inputText; // fmemopen reads straight out of this
    FILE* input;
    StringWriteOutput console;
    RunFlags flags;

    Harness(std::string in = "", RunFlags fl = RunFlags()) : inputText(in), flags(fl) {
        if (inputText.size() > 0) {
            input = fmemopen((void*)inputText.data(), inputText.size(), "r");
        }
        else {
            input = fopen("/dev/null", "r");
        }
    }

    ~Harness() {
        if (input != NULL) {
            fclose(input);
        }
    }

    ObjectRef run(std::string source, ObjectRef entry = makeNumber(0)) {
        std::unique_ptr<Program> program(parseSource(source));
        Evaluator evaluator(program.get(), defaultBuiltins(console, input, flags), flags);
        return evaluator.run(entry);
    }

    ObjectRef runLua(std::string source, ObjectRef entry = makeNumber(0)) {
        std::unique_ptr<Program> program(parseSource(source));
        LuaHost host(defaultBuiltins(console, input, flags));
        return host.run(renderLua(program.get(), flags), entry);
    }
};


inline DslError::Kind errorKind(std::function<void()> thing) { // the kind of DslError thing throws. not throwing fails the test
    try {
        thing();
    } catch (DslError& e) {
        return e.kind;
    }
    ADD_FAILURE() << "expected a DslError";
    return DslError::Syntax;
}
