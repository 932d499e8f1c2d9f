// Parser turns the Scanner's tokens into a Program. It looks two tokens ahead and never backtracks.
// Every node it allocates goes into the Program's arena, so a failed parse can clean up by deleting the Program.
#pragma once
#include <defs.h>
#include <scanner.hpp>
#include <types/Expression.hpp>
#include <types/Program.hpp>
#include <string>


struct Parser {
    Scanner scanner;
    Token current;
    Token next;
    Program* program = NULL;

    Parser(MapView source);

    Program* parse(); // caller owns the result. throws a Syntax DslError (and leaks nothing) on bad input

private:
    void advance();

    bool isWord(const char* word); // current is the identifier `word`

    bool isOperator(const char* op);

    Token expect(Token::Type type); // consume current if it's the right type, otherwise throw

    void fail(std::string expected);

    template <typename T, typename... Args>
    T* make(Args... args) {
        T* node = new T(args...);
        program -> nodes.push_back(node);
        return node;
    }

    Function* function();

    Block* block();

    Statement* statement();

    Expr* expression(int minPrec);

    Expr* atom();

    Expr* parenthesized();

    static int precedence(Token& token, Expression::Op* op); // 0 if token isn't a binary operator
};
