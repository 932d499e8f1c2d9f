#include <runtime/types.hpp>


const char* RuntimeObject::typeName(Type t) {
    switch (t) {
        case None: return "none";
        case Number: return "number";
        case String: return "string";
        case Boolean: return "boolean";
        case Array: return "array";
    }
    return "unknown";
}

ObjectRef makeNone() {
    return std::make_shared<NoneObject>();
}

ObjectRef makeNumber(double value) {
    return std::make_shared<NumberObject>(value);
}

ObjectRef makeString(std::string value) {
    return std::make_shared<StringObject>(value);
}

ObjectRef makeBoolean(bool value) {
    return std::make_shared<BooleanObject>(value);
}

ObjectRef makeArray(std::vector<ObjectRef> elements) {
    return std::make_shared<ArrayObject>(elements);
}
