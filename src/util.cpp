#include <util.hpp>
#include <stdio.h>
#include <stdlib.h>
#include <math.h>
// definitions for util functions


bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

bool isLetter(char thing) {
    return (thing >= 'a' && thing <= 'z') || (thing >= 'A' && thing <= 'Z');
}

bool isDigit(char thing) {
    return thing >= '0' && thing <= '9';
}

std::string formatNumber(double number) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.14g", number);
    return buffer;
}

std::string quoteLua(std::string thing) {
    std::string ret = "\"";
    ret.reserve(thing.size() + 2);
    for (size_t i = 0; i < thing.size(); i ++) {
        unsigned char c = thing[i];
        if (c == '"' || c == '\\') {
            ret += '\\';
            ret += c;
        }
        else if (c < 0x20 || c == 0x7f) { // decimal escapes are the only kind Lua 5.1 has
            char esc[8];
            snprintf(esc, sizeof(esc), "\\%03d", c);
            ret += esc;
        }
        else {
            ret += c;
        }
    }
    ret += '"';
    return ret;
}

bool parseNumber(std::string text, double* out) {
    size_t first = 0;
    while (first < text.size() && isWhitespace(text[first])) {
        first ++;
    }
    if (first == text.size()) {
        return false;
    }
    for (size_t i = first; i < text.size(); i ++) { // plain decimal only: strtod would also take hex, inf and nan
        char c = text[i];
        if (!(isDigit(c) || isWhitespace(c) || c == '.' || c == '+' || c == '-' || c == 'e' || c == 'E')) {
            return false;
        }
    }
    const char* begin = text.c_str() + first;
    char* stop;
    double value = strtod(begin, &stop);
    if (stop == begin) {
        return false;
    }
    while (*stop != 0) {
        if (!isWhitespace(*stop)) {
            return false;
        }
        stop ++;
    }
    if (!isfinite(value)) { // 1e999
        return false;
    }
    *out = value;
    return true;
}
