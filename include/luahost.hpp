// LuaHost runs rendered dumblang programs inside an embedded LuaJIT.
// The builtins it's handed are bridged into Lua as C closures, so a program's I/O goes to the same place whichever way it runs.
#pragma once
#include <defs.h>
#include <evaluator.hpp>
#include <errors.hpp>
#include <lua.hpp>
#include <map>
#include <memory>
#include <string>


struct LuaHost {
    lua_State* lua;
    BuiltinTable builtins; // lua holds pointers into this map, so it never changes after construction
    std::shared_ptr<DslError> pending; // a builtin failed; rethrown once lua has unwound

    LuaHost(BuiltinTable table);

    LuaHost(const LuaHost&) = delete;

    LuaHost& operator=(const LuaHost&) = delete; // both copies would lua_close the same state

    ~LuaHost();

    ObjectRef run(std::string source, ObjectRef entry); // load a chunk rendered by LuaWriter and call its main with entry

    void push(ObjectRef value); // copies arrays into fresh tables

    ObjectRef pull(int index); // copies tables into fresh arrays

private:
    void push(ObjectRef value, std::map<RuntimeObject*, int>& seen);

    ObjectRef pull(int index, std::map<const void*, ObjectRef>& seen);

    static int bridge(lua_State* L);

    void fail(DslError::Kind kind, int base); // pops lua's error message and throws it
};
