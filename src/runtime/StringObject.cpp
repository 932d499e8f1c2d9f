#include <runtime/types.hpp>


StringObject::StringObject(std::string data) {
    content = data;
    type = Type::String;
}

bool StringObject::equals(RuntimeObject* thing) {
    if (thing -> type != type) { // "3" is not 3
        return false;
    }
    return ((StringObject*)thing) -> content == content;
}

std::string StringObject::toString() {
    return content;
}

bool StringObject::truthyness() { // empty strings are falsey, but otherwise strings are always truthy
    return content.size() > 0;
}
