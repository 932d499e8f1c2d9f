#pragma once
#include <string>


struct Token {
    enum Type {
        NONE,
        OPERATOR,       // + - * / ^ < > ==, and anything else the scanner doesn't recognize
        IDENTIFIER,     // keywords are identifiers too, the parser sorts them out
        STRING_LITERAL,
        NUMBER_LITERAL,
        EXPR_END,       // ;
        L_BLOCK,        // {
        R_BLOCK,        // }
        L_PAREN,        // (
        R_PAREN,        // )
        ARR_START,      // [
        ARR_END,        // ]
        ARR_SEP,        // ,
        ASSIGN,         // a lone =
        END             // end of input. there's exactly one of these, at the end
    } type = NONE;
    std::string content;
    int line = 1;

    Token() {}

    Token(Type t, std::string c, int l) : type(t), content(c), line(l) {}

    std::string describe(); // for error messages: IDENTIFIER 'foo'

    static const char* typeName(Type t);
};
