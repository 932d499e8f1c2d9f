#include <parser.hpp>
#include <errors.hpp>
#include <util.hpp>
#include <types/Program.hpp>
#include <types/Function.hpp>
#include <types/Block.hpp>
#include <types/Identifier.hpp>
#include <types/NumberLiteral.hpp>
#include <types/StringLiteral.hpp>
#include <types/Array.hpp>
#include <types/FunctionCall.hpp>
#include <types/ArrAcc.hpp>
#include <types/WhileLoop.hpp>
#include <types/IfElse.hpp>
#include <types/Return.hpp>
#include <string.h>
#include <stdlib.h>


Parser::Parser(MapView source) : scanner(source) {
    current = scanner.next();
    next = scanner.next();
}

void Parser::advance() {
    current = next;
    next = scanner.next();
}

bool Parser::isWord(const char* word) {
    return current.type == Token::IDENTIFIER && current.content == word;
}

bool Parser::isOperator(const char* op) {
    return current.type == Token::OPERATOR && current.content == op;
}

void Parser::fail(std::string expected) {
    throw DslError(DslError::Syntax, "Expected " + expected + ", got " + current.describe(), current.line);
}

Token Parser::expect(Token::Type type) {
    if (current.type != type) {
        fail(Token::typeName(type));
    }
    Token ret = current;
    advance();
    return ret;
}

int Parser::precedence(Token& token, Expression::Op* op) {
    if (token.type == Token::ASSIGN) {
        *op = Expression::ASSIGN;
        return 1;
    }
    if (token.type != Token::OPERATOR) {
        return 0;
    }
    if (token.content == "==") { *op = Expression::EQ; return 5; }
    if (token.content == "<") { *op = Expression::LT; return 5; }
    if (token.content == ">") { *op = Expression::GT; return 5; }
    if (token.content == "+") { *op = Expression::ADD; return 1; }
    if (token.content == "-") { *op = Expression::SUB; return 1; }
    if (token.content == "*") { *op = Expression::MUL; return 10; }
    if (token.content == "/") { *op = Expression::DIV; return 10; }
    if (token.content == "^") { *op = Expression::POW; return 30; }
    return 0; // garbage characters have no binding power
}

Program* Parser::parse() {
    program = new Program(current.line);
    try {
        bool hasMain = false;
        while (current.type != Token::END) {
            Function* f = function();
            if (program -> find(f -> name) != NULL) {
                throw DslError(DslError::Syntax, "Function '" + f -> name + "' is defined more than once", f -> line);
            }
            if (f -> name == "main") {
                hasMain = true;
            }
            program -> functions.push_back(f);
        }
        if (!hasMain) {
            throw DslError(DslError::Syntax, "Program has no main function", current.line);
        }
    } catch (DslError&) {
        delete program; // takes every node allocated so far with it
        program = NULL;
        throw;
    }
    Program* ret = program;
    program = NULL;
    return ret;
}

Function* Parser::function() {
    Token name = expect(Token::IDENTIFIER);
    expect(Token::L_PAREN);
    std::string param;
    if (current.type == Token::IDENTIFIER) {
        param = current.content;
        advance();
    }
    else if (name.content == "main") {
        param = "env"; // main always gets the entry value, named or not
    }
    expect(Token::R_PAREN);
    Block* body = block();
    return make<Function>(name.line, name.content, param, body);
}

Block* Parser::block() {
    Block* ret = make<Block>(current.line);
    expect(Token::L_BLOCK);
    while (current.type != Token::R_BLOCK) {
        if (current.type == Token::END) {
            fail("R_BLOCK");
        }
        ret -> statements.push_back(statement());
    }
    advance();
    return ret;
}

Statement* Parser::statement() {
    int line = current.line;
    if (isWord("if") && next.type == Token::L_PAREN) {
        advance();
        advance();
        Expr* condition = expression(0);
        expect(Token::R_PAREN);
        Block* mainBlock = block();
        if (!isWord("else")) {
            fail("'else'");
        }
        advance();
        Block* elseBlock = block();
        return make<IfElse>(line, condition, mainBlock, elseBlock);
    }
    if (isWord("while") && next.type == Token::L_PAREN) {
        advance();
        advance();
        Expr* condition = expression(0);
        expect(Token::R_PAREN);
        Block* body = block();
        return make<WhileLoop>(line, condition, body);
    }
    Expr* ret = expression(0);
    expect(Token::EXPR_END);
    return ret;
}

Expr* Parser::expression(int minPrec) { // precedence climbing
    Expr* left = atom();
    while (true) {
        Expression::Op op;
        int prec = precedence(current, &op);
        if (prec == 0 || prec < minPrec) {
            return left;
        }
        int line = current.line;
        advance();
        bool rightAssoc = op == Expression::POW || op == Expression::ASSIGN;
        Expr* right = expression(rightAssoc ? prec : prec + 1);
        left = make<Expression>(line, left, op, right);
    }
}

Expr* Parser::atom() {
    int line = current.line;
    if (current.type == Token::ARR_START) {
        advance();
        Array* ret = make<Array>(line);
        while (current.type != Token::ARR_END) {
            ret -> elements.push_back(expression(0));
            if (current.type == Token::ARR_SEP) {
                advance();
            }
            else if (current.type != Token::ARR_END) {
                fail("ARR_SEP or ARR_END");
            }
        }
        advance();
        return ret;
    }
    if (current.type == Token::IDENTIFIER) {
        Token name = current;
        advance();
        if (name.content == "return") { // before calls, so return (x) is a return and not a call to "return"
            switch (current.type) {
                case Token::EXPR_END:
                case Token::R_PAREN:
                case Token::R_BLOCK:
                case Token::ARR_END:
                    return make<Return>(line, (Expr*)NULL);
                default:
                    return make<Return>(line, expression(0));
            }
        }
        if (current.type == Token::L_PAREN) {
            advance();
            Expr* arg = NULL;
            if (current.type != Token::R_PAREN) {
                arg = expression(0);
            }
            expect(Token::R_PAREN);
            return make<FunctionCall>(line, name.content, arg);
        }
        Expr* ret = make<Identifier>(line, name.content);
        while (current.type == Token::ARR_START) { // a[i][j]
            advance();
            Expr* idx = expression(0);
            expect(Token::ARR_END);
            ret = make<ArrAcc>(line, ret, idx);
        }
        return ret;
    }
    if (current.type == Token::NUMBER_LITERAL) {
        double value = strtod(current.content.c_str(), NULL);
        advance();
        return make<NumberLiteral>(line, value);
    }
    if (current.type == Token::STRING_LITERAL) {
        std::string value = current.content;
        advance();
        return make<StringLiteral>(line, value);
    }
    if (current.type == Token::L_PAREN) {
        return parenthesized();
    }
    fail("an expression");
    return NULL;
}

Expr* Parser::parenthesized() {
    int line = current.line;
    advance();
    Expr* ret;
    if (isOperator("+") || isOperator("-")) { // (-x) is the only place a sign is allowed; it becomes -1.0 * (x)
        double sign = isOperator("-") ? -1.0 : 1.0;
        advance();
        Expr* rest = expression(0);
        ret = make<Expression>(line, make<NumberLiteral>(line, sign), Expression::MUL, rest);
    }
    else {
        ret = expression(0);
    }
    expect(Token::R_PAREN);
    return ret;
}
