#include <runtime/types.hpp>


NoneObject::NoneObject() {
    type = Type::None;
}

bool NoneObject::equals(RuntimeObject* thing) {
    return thing -> type == type;
}

std::string NoneObject::toString() {
    return "none";
}

bool NoneObject::truthyness() {
    return false;
}
