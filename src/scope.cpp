#include <scope.hpp>
#include <errors.hpp>
#include <types/Function.hpp>


ObjectRef Scope::lookup(const std::string& name, int line) {
    auto found = store.find(name);
    if (found == store.end()) {
        throw DslError(DslError::Name, "Undefined variable '" + name + "' in function '" + function -> name + "'", line);
    }
    return found -> second;
}

void Scope::assign(const std::string& name, ObjectRef value) {
    store[name] = value;
}
