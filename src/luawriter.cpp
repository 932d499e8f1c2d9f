// WriteOutput is where text goes: a file descriptor, a stdio stream, or a string.
// LuaWriter renders a Program as a Lua program onto a WriteOutput. It never evaluates anything.
#include <luawriter.hpp>
#include <util.hpp>
#include <unistd.h>
#include <math.h>


void WriteOutput::write(std::string data) {
    write(data.c_str(), data.size());
}


FileWriteOutput::FileWriteOutput(int fd) {
    file = fd;
}

void FileWriteOutput::write(const char* data, size_t length) {
    while (length > 0) {
        size_t writeSize = BufferSize - bufferPos; // the space remaining
        if (writeSize > length) {
            writeSize = length;
        }
        if (writeSize == 0) {
            flush();
        }
        else {
            for (size_t i = 0; i < writeSize; i ++) {
                buffer[bufferPos + i] = data[i];
            }
            bufferPos += writeSize;
            data += writeSize;
            length -= writeSize;
        }
    }
}

void FileWriteOutput::flush() {
    size_t done = 0;
    while (done < bufferPos) {
        ssize_t n = ::write(file, buffer + done, bufferPos - done);
        if (n <= 0) {
            printf(ERROR "Couldn't write output!\n");
            perror("\twrite");
            break;
        }
        done += n;
    }
    bufferPos = 0;
}

FileWriteOutput::~FileWriteOutput() {
    flush();
    ::close(file);
}


StdioWriteOutput::StdioWriteOutput(FILE* s) : stream(s) {}

void StdioWriteOutput::write(const char* data, size_t length) {
    fwrite(data, 1, length, stream);
}

void StdioWriteOutput::flush() {
    fflush(stream);
}


void StringWriteOutput::write(const char* data, size_t length) {
    content += std::string(data, length);
}


// the helpers give Lua dumblang's semantics where the two languages disagree: truthiness (0 and "" are true in Lua),
// floor division, + on strings and arrays, value equality for arrays, and 0-based indexing that counts back from the end.
static const char* luaPrelude = R"lua(local H = rawget(_G, "dslhost")
local F, V = {}, {}

local str

local function repr(x, open)
    if type(x) == "string" then
        return "\"" .. x .. "\""
    end
    return str(x, open)
end

str = function(x, open)
    if x == nil then
        return "none"
    elseif type(x) == "number" then
        return string.format("%.14g", x)
    elseif type(x) == "table" then
        open = open or {}
        if open[x] then
            return "[...]"
        end
        open[x] = true
        local parts = {}
        for i = 1, #x do
            parts[i] = repr(x[i], open)
        end
        open[x] = nil
        return "[" .. table.concat(parts, ", ") .. "]"
    end
    return tostring(x)
end

local function truthy(x)
    if x == nil or x == false then
        return false
    elseif type(x) == "number" then
        return x ~= 0
    elseif type(x) == "string" then
        return x ~= ""
    elseif type(x) == "table" then
        return #x > 0
    end
    return true
end

local function add(a, b)
    if type(a) == "string" and type(b) == "string" then
        return a .. b
    elseif type(a) == "table" and type(b) == "table" then
        local r = {}
        for i = 1, #a do
            r[#r + 1] = a[i]
        end
        for i = 1, #b do
            r[#r + 1] = b[i]
        end
        return r
    end
    return a + b
end

local function idiv(a, b)
    if b == 0 then
        error("division by zero", 2)
    end
    return math.floor(a / b)
end

local function eq(a, b, comparing)
    if type(a) ~= type(b) then
        return false
    elseif type(a) ~= "table" or a == b then
        return a == b
    elseif #a ~= #b then
        return false
    end
    comparing = comparing or {}
    comparing[a] = comparing[a] or {}
    if comparing[a][b] then
        return true
    end
    comparing[a][b] = true
    for i = 1, #a do
        if not eq(a[i], b[i], comparing) then
            return false
        end
    end
    return true
end

local function ix(a, i)
    if type(i) ~= "number" then
        error("index must be a number", 3)
    end
    if i < 0 then
        i = math.ceil(i)
    else
        i = math.floor(i)
    end
    if i < 0 then
        i = i + #a
    end
    if i < 0 or i >= #a then
        error("index out of range", 3)
    end
    return i + 1
end

local function at(a, i)
    local k = ix(a, i)
    if type(a) == "string" then
        return a:sub(k, k)
    end
    return a[k]
end

local function seti(a, i, x)
    if type(a) ~= "table" then
        error("only arrays support element assignment", 2)
    end
    a[ix(a, i)] = x
    return x
end

local function discard()
end

F["print"] = function(x)
    io.write("DSL> ", str(x), "\n")
end

F["inpstr"] = function()
    if prompts then
        io.write("DSL<(str)\n")
    end
    local line = io.read("*l")
    if line == nil then
        error("end of input", 2)
    end
    return line
end

F["inpnum"] = function()
    if prompts then
        io.write("DSL<(num)\n")
    end
    local line = io.read("*l")
    if line == nil then
        error("end of input", 2)
    end
    local x = tonumber(line)
    if x == nil or line:find("[xX]") or x ~= x or x == math.huge or x == -math.huge then
        error("could not parse '" .. line .. "' as a number", 2)
    end
    return x
end

F["sqrt"] = function(x)
    if x < 0 then
        error("math domain error", 2)
    end
    return math.sqrt(x)
end

if H then
    for name, fn in pairs(H.builtins) do
        F[name] = fn
    end
end
)lua";


LuaWriter::LuaWriter(WriteOutput& out, RunFlags fl) : output(out), flags(fl) {}

void LuaWriter::line(int indent, std::string text) {
    for (int i = 0; i < indent; i ++) {
        output.write("    ", 4);
    }
    output.write(text);
    output.write("\n", 1);
}

void LuaWriter::prelude() {
    line(0, "-- rendered by dumblang");
    line(0, flags.prompts ? "local prompts = true" : "local prompts = false");
    output.write(luaPrelude);
    line(0, "");
}

void LuaWriter::trailer() {
    line(0, "if H then");
    line(1, "return F");
    line(0, "end");
    line(0, "return F[\"main\"](0)");
}

std::string LuaWriter::variable(std::string name) {
    return "v[" + quoteLua(name) + "]";
}

std::string LuaWriter::function(std::string name) {
    return "F[" + quoteLua(name) + "]";
}

std::string LuaWriter::number(double value) {
    if (isinf(value)) { // a long enough digit run gets here
        return value > 0 ? "math.huge" : "(-math.huge)";
    }
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.17g", value);
    if (value < 0) { // -1 ^ 2 is -(1 ^ 2) in Lua
        return "(" + std::string(buffer) + ")";
    }
    return buffer;
}

std::string LuaWriter::string(std::string value) {
    return quoteLua(value);
}
