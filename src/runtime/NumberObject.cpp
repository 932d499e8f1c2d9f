#include <runtime/types.hpp>
#include <util.hpp>


NumberObject::NumberObject(double data) {
    content = data;
    type = Type::Number;
}

bool NumberObject::equals(RuntimeObject* thing) {
    if (thing -> type != type) {
        return false;
    }
    return ((NumberObject*)thing) -> content == content;
}

std::string NumberObject::toString() {
    return formatNumber(content);
}

bool NumberObject::truthyness() {
    return content != 0; // 0 is falsey, everything else is truthy
}
