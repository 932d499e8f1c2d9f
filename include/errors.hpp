// DslError is the only thing dumblang throws. Everything is fatal to the run; the host decides what to do with it.
#pragma once
#include <stdexcept>
#include <string>


struct DslError : std::runtime_error {
    enum Kind {
        Syntax,  // the parser didn't get what it expected (this includes anything the scanner couldn't make sense of)
        Name,    // unknown function or unset variable
        Type,    // operand kinds the operator doesn't accept
        Runtime, // division by zero, bad index, too much recursion...
        Host,    // builtin I/O failures
        Backend  // the Lua side couldn't render or load something
    } kind;
    int line; // 0 if we don't know

    DslError(Kind k, std::string message, int l = 0);

    std::string message; // what() without the line prefix

    static const char* kindName(Kind k);
};
