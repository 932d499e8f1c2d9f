// Scanner turns dumblang source into tokens, one at a time, on demand.
// It never backtracks and never fails: anything it can't make sense of comes out as an OPERATOR token, which the parser will choke on with a line number.
#pragma once
#include <token.hpp>
#include <mapview.hpp>


struct Scanner {
    MapView data;
    int line = 1;

    Scanner(MapView source);

    Token next(); // after END, this keeps returning END

private:
    void skipIgnored(); // whitespace and comments

    Token identifier();

    Token number();

    Token string();
};
