#pragma once
#include <string>
#include <defs.h>

bool isWhitespace(char thing);

bool isLetter(char thing); // ASCII letters only. dumblang identifiers don't get digits or underscores

bool isDigit(char thing);

std::string formatNumber(double number); // the one true way to print a dumblang number: C's %.14g, which is also what Lua does

std::string quoteLua(std::string thing); // turn arbitrary bytes into a Lua string literal, quotes included

bool parseNumber(std::string text, double* out); // strict: the whole string (minus surrounding whitespace) has to be a finite decimal number
