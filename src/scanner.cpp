#include <scanner.hpp>
#include <util.hpp>


const char* Token::typeName(Type t) {
    switch (t) {
        case NONE: return "NONE";
        case OPERATOR: return "OPERATOR";
        case IDENTIFIER: return "IDENTIFIER";
        case STRING_LITERAL: return "STRING_LITERAL";
        case NUMBER_LITERAL: return "NUMBER_LITERAL";
        case EXPR_END: return "EXPR_END";
        case L_BLOCK: return "L_BLOCK";
        case R_BLOCK: return "R_BLOCK";
        case L_PAREN: return "L_PAREN";
        case R_PAREN: return "R_PAREN";
        case ARR_START: return "ARR_START";
        case ARR_END: return "ARR_END";
        case ARR_SEP: return "ARR_SEP";
        case ASSIGN: return "ASSIGN";
        case END: return "END";
    }
    return "NONE";
}

std::string Token::describe() {
    if (type == END) {
        return "end of input";
    }
    return std::string(typeName(type)) + " '" + content + "'";
}


Scanner::Scanner(MapView source) : data(source) {}

void Scanner::skipIgnored() {
    while (data.len() > 0) {
        if (data[0] == '#') { // line comment, runs through the newline
            data.skipTo('\n');
            continue;
        }
        if (!isWhitespace(data[0])) {
            return;
        }
        if (data[0] == '\n') {
            line ++;
        }
        data ++;
    }
}

Token Scanner::next() {
    skipIgnored();
    if (data.len() == 0) {
        return Token(Token::END, "", line);
    }
    char c = data[0];
    if (isLetter(c)) {
        return identifier();
    }
    if (isDigit(c)) {
        return number();
    }
    if (c == '"') {
        return string();
    }
    data ++;
    switch (c) {
        case '(': return Token(Token::L_PAREN, "(", line);
        case ')': return Token(Token::R_PAREN, ")", line);
        case '{': return Token(Token::L_BLOCK, "{", line);
        case '}': return Token(Token::R_BLOCK, "}", line);
        case '[': return Token(Token::ARR_START, "[", line);
        case ']': return Token(Token::ARR_END, "]", line);
        case ';': return Token(Token::EXPR_END, ";", line);
        case ',': return Token(Token::ARR_SEP, ",", line);
        case '=':
            if (data[0] == '=') { // a pending = followed by another = is equality
                data ++;
                return Token(Token::OPERATOR, "==", line);
            }
            return Token(Token::ASSIGN, "=", line);
    }
    return Token(Token::OPERATOR, std::string(1, c), line); // + - * / ^ < >, or garbage
}

Token Scanner::identifier() {
    std::string text;
    while (isLetter(data[0])) {
        text += data[0];
        data ++;
    }
    return Token(Token::IDENTIFIER, text, line);
}

Token Scanner::number() {
    std::string text;
    bool point = false;
    while (true) {
        char c = data[0];
        if (isDigit(c)) {
            text += c;
        }
        else if (c == '.' && !point) {
            point = true;
            text += c;
        }
        else {
            break;
        }
        data ++;
    }
    return Token(Token::NUMBER_LITERAL, text, line);
}

Token Scanner::string() {
    data ++; // opening quote
    std::string text;
    while (data.len() > 0 && data[0] != '"' && data[0] != '\n') {
        text += data[0];
        data ++;
    }
    if (data[0] != '"') { // ran into a newline or the end: hand the parser something it will reject
        return Token(Token::OPERATOR, "\"" + text, line);
    }
    data ++;
    return Token(Token::STRING_LITERAL, text, line);
}
