#include <errors.hpp>


static std::string withLine(std::string message, int line) {
    if (line > 0) {
        return "line " + std::to_string(line) + ": " + message;
    }
    return message;
}

DslError::DslError(Kind k, std::string m, int l) : std::runtime_error(withLine(m, l)), kind(k), line(l), message(m) {}

const char* DslError::kindName(Kind k) {
    switch (k) {
        case Syntax:
            return "Syntax";
        case Name:
            return "Name";
        case Type:
            return "Type";
        case Runtime:
            return "Runtime";
        case Host:
            return "Host";
        case Backend:
            return "Backend";
    }
    return "Unknown";
}
