#include <runtime/types.hpp>
#include <errors.hpp>
#include <algorithm>


ArrayObject::ArrayObject() {
    type = Type::Array;
}

ArrayObject::ArrayObject(std::vector<ObjectRef> data) : content(data) {
    type = Type::Array;
}

ArrayObject::~ArrayObject() {
    std::vector<ObjectRef> doomed; // arrays only we hold. emptied one at a time instead of recursively
    for (ObjectRef& element : content) {
        if (element && element.use_count() == 1 && element -> type == Type::Array) {
            doomed.push_back(std::move(element));
        }
    }
    content.clear();
    while (doomed.size() > 0) {
        ObjectRef item = std::move(doomed.back());
        doomed.pop_back();
        ArrayObject* array = (ArrayObject*)item.get();
        for (ObjectRef& element : array -> content) {
            if (element && element.use_count() == 1 && element -> type == Type::Array) {
                doomed.push_back(std::move(element));
            }
        }
        array -> content.clear();
    } // item dies here with nothing left to recurse into
}

bool ArrayObject::equals(RuntimeObject* thing) {
    if (thing -> type != type) {
        return false;
    }
    Comparing comparing;
    return equals((ArrayObject*)thing, comparing, 0);
}

bool ArrayObject::equals(ArrayObject* other, Comparing& comparing, size_t depth) {
    if (other == this) {
        return true;
    }
    if (other -> content.size() != content.size()) {
        return false;
    }
    if (depth > MaxNesting) {
        throw DslError(DslError::Runtime, "comparison nests too deeply");
    }
    if (!comparing.insert(std::make_pair(this, other)).second) { // cyclic: this pair is already being compared further up
        return true;
    }
    for (size_t i = 0; i < content.size(); i ++) {
        RuntimeObject* mine = content[i].get();
        RuntimeObject* theirs = other -> content[i].get();
        if (mine -> type == Type::Array && theirs -> type == Type::Array) {
            if (!((ArrayObject*)mine) -> equals((ArrayObject*)theirs, comparing, depth + 1)) {
                return false;
            }
        }
        else if (!mine -> equals(theirs)) {
            return false;
        }
    }
    return true;
}

std::string ArrayObject::toString() { // [1, "two", [3]]
    std::vector<ArrayObject*> open;
    return toString(open);
}

std::string ArrayObject::toString(std::vector<ArrayObject*>& open) {
    if (std::find(open.begin(), open.end(), this) != open.end()) {
        return "[...]";
    }
    if (open.size() > MaxNesting) {
        throw DslError(DslError::Runtime, "array nests too deeply to print");
    }
    open.push_back(this);
    std::string ret = "[";
    for (size_t i = 0; i < content.size(); i ++) {
        if (i > 0) {
            ret += ", ";
        }
        RuntimeObject* element = content[i].get();
        if (element -> type == Type::Array) {
            ret += ((ArrayObject*)element) -> toString(open);
        }
        else if (element -> type == Type::String) {
            ret += "\"" + element -> toString() + "\"";
        }
        else {
            ret += element -> toString();
        }
    }
    open.pop_back();
    return ret + "]";
}

bool ArrayObject::truthyness() {
    return content.size() > 0;
}
