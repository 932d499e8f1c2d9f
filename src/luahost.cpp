#include <luahost.hpp>
#include <runtime/types.hpp>


LuaHost::LuaHost(BuiltinTable table) : builtins(table) {
    lua = luaL_newstate();
    if (lua == NULL) {
        throw DslError(DslError::Backend, "couldn't create a Lua state");
    }
    luaL_openlibs(lua);
    lua_createtable(lua, 0, 1); // "dslhost" table
    lua_createtable(lua, 0, builtins.size()); // dslhost.builtins
    for (auto& entry : builtins) {
        lua_pushlightuserdata(lua, this);
        lua_pushlightuserdata(lua, &entry.second);
        lua_pushcclosure(lua, bridge, 2);
        lua_setfield(lua, -2, entry.first.c_str());
    }
    lua_setfield(lua, -2, "builtins");
    lua_setglobal(lua, "dslhost"); // the rendered prelude picks this up and layers it over its own builtins
}

LuaHost::~LuaHost() {
    lua_close(lua);
}

int LuaHost::bridge(lua_State* L) {
    LuaHost* host = (LuaHost*)lua_touserdata(L, lua_upvalueindex(1));
    Builtin* builtin = (Builtin*)lua_touserdata(L, lua_upvalueindex(2));
    bool failed = false;
    try { // nothing with a destructor can be alive when lua_error longjmps, so errors leave this block first
        ObjectRef argument = lua_gettop(L) >= 1 ? host -> pull(1) : makeNone();
        ObjectRef result = (*builtin)(argument);
        lua_settop(L, 0);
        host -> push(result ? result : makeNone());
    } catch (DslError& e) {
        host -> pending = std::make_shared<DslError>(e);
        failed = true;
    } catch (std::exception& e) {
        host -> pending = std::make_shared<DslError>(DslError::Host, e.what());
        failed = true;
    }
    if (failed) {
        lua_pushstring(L, host -> pending -> message.c_str());
        return lua_error(L);
    }
    return 1;
}

void LuaHost::fail(DslError::Kind kind, int base) {
    const char* message = lua_tostring(lua, -1);
    std::string text = message == NULL ? "unknown Lua error" : message;
    lua_settop(lua, base);
    if (pending) { // the real error came from one of our builtins
        std::shared_ptr<DslError> error = pending;
        pending.reset();
        throw *error;
    }
    throw DslError(kind, text);
}

ObjectRef LuaHost::run(std::string source, ObjectRef entry) {
    int base = lua_gettop(lua);
    pending.reset();
    if (luaL_loadbuffer(lua, source.c_str(), source.size(), "=dumblang") != 0) {
        fail(DslError::Backend, base);
    }
    if (lua_pcall(lua, 0, 1, 0) != 0) { // with dslhost set, the chunk hands back its function table instead of running
        fail(DslError::Runtime, base);
    }
    if (!lua_istable(lua, -1)) {
        lua_settop(lua, base);
        throw DslError(DslError::Backend, "the Lua chunk didn't return a function table");
    }
    lua_getfield(lua, -1, "main");
    if (!lua_isfunction(lua, -1)) {
        lua_settop(lua, base);
        throw DslError(DslError::Backend, "the Lua chunk has no main function");
    }
    push(entry);
    if (lua_pcall(lua, 1, 1, 0) != 0) {
        fail(DslError::Runtime, base);
    }
    ObjectRef ret = pull(-1);
    lua_settop(lua, base);
    return ret;
}

void LuaHost::push(ObjectRef value) {
    std::map<RuntimeObject*, int> seen;
    push(value, seen);
}

void LuaHost::push(ObjectRef value, std::map<RuntimeObject*, int>& seen) {
    if (!lua_checkstack(lua, 3)) {
        throw DslError(DslError::Backend, "value is nested too deeply for Lua");
    }
    switch (value -> type) {
        case RuntimeObject::None:
            lua_pushnil(lua);
            break;
        case RuntimeObject::Number:
            lua_pushnumber(lua, ((NumberObject*)value.get()) -> content);
            break;
        case RuntimeObject::String: {
            std::string& s = ((StringObject*)value.get()) -> content;
            lua_pushlstring(lua, s.c_str(), s.size());
            break;
        }
        case RuntimeObject::Boolean:
            lua_pushboolean(lua, ((BooleanObject*)value.get()) -> content);
            break;
        case RuntimeObject::Array: {
            auto found = seen.find(value.get());
            if (found != seen.end()) { // an array that contains itself
                lua_pushvalue(lua, found -> second);
                break;
            }
            std::vector<ObjectRef>& content = ((ArrayObject*)value.get()) -> content;
            lua_createtable(lua, content.size(), 0);
            int table = lua_gettop(lua);
            seen[value.get()] = table;
            for (size_t i = 0; i < content.size(); i ++) {
                push(content[i], seen);
                lua_rawseti(lua, table, i + 1);
            }
            seen.erase(value.get());
            break;
        }
    }
}

ObjectRef LuaHost::pull(int index) {
    std::map<const void*, ObjectRef> seen;
    return pull(index, seen);
}

ObjectRef LuaHost::pull(int index, std::map<const void*, ObjectRef>& seen) {
    if (index < 0) {
        index = lua_gettop(lua) + index + 1;
    }
    switch (lua_type(lua, index)) {
        case LUA_TNIL:
        case LUA_TNONE:
            return makeNone();
        case LUA_TNUMBER:
            return makeNumber(lua_tonumber(lua, index));
        case LUA_TSTRING: {
            size_t length;
            const char* s = lua_tolstring(lua, index, &length);
            return makeString(std::string(s, length));
        }
        case LUA_TBOOLEAN:
            return makeBoolean(lua_toboolean(lua, index));
        case LUA_TTABLE: {
            const void* key = lua_topointer(lua, index);
            auto found = seen.find(key);
            if (found != seen.end()) {
                return found -> second;
            }
            if (!lua_checkstack(lua, 2)) {
                throw DslError(DslError::Backend, "Lua table is nested too deeply");
            }
            ObjectRef ret = std::make_shared<ArrayObject>();
            seen[key] = ret;
            size_t length = lua_objlen(lua, index);
            std::vector<ObjectRef>& content = ((ArrayObject*)ret.get()) -> content;
            for (size_t i = 1; i <= length; i ++) {
                lua_rawgeti(lua, index, i);
                content.push_back(pull(-1, seen));
                lua_pop(lua, 1);
            }
            return ret;
        }
    }
    throw DslError(DslError::Backend, std::string("can't turn a Lua ") + lua_typename(lua, lua_type(lua, index)) + " into a dumblang value");
}
