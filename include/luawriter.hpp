// WriteOutput is where text goes: a file descriptor, a stdio stream, or a string.
// LuaWriter renders a Program as a Lua program onto a WriteOutput. It never evaluates anything.
#pragma once
#include <string>
#include <stdio.h>
#include <defs.h>
#include <runflags.h>


struct WriteOutput {
    virtual ~WriteOutput() {}

    virtual void write(const char* data, size_t length) = 0;

    virtual void flush() {}

    void write(std::string data);
};


struct FileWriteOutput : WriteOutput {
    using WriteOutput::write;

    const static int BufferSize = 4096; // 4kb buffer
    int file;
    char buffer[BufferSize]; // buffer to prevent small writes
    size_t bufferPos = 0;

    FileWriteOutput(int fd);

    ~FileWriteOutput(); // Destructing a FileWriteOutput will flush the buffer and close the file.

    void write(const char* data, size_t length); // load some data into the buffer, and flush the buffer if the data overfills

    void flush();
};


struct StdioWriteOutput : WriteOutput { // shares stdio's buffer, so it interleaves properly with printf
    using WriteOutput::write;

    FILE* stream;

    StdioWriteOutput(FILE* s);

    void write(const char* data, size_t length);

    void flush();
};


struct StringWriteOutput : WriteOutput {
    using WriteOutput::write;

    std::string content;

    void write(const char* data, size_t length);
};


struct LuaWriter {
    WriteOutput& output;
    RunFlags flags;

    LuaWriter(WriteOutput& out, RunFlags fl = RunFlags());

    void line(int indent, std::string text);

    void prelude(); // helpers + default builtins

    void trailer();

    std::string variable(std::string name); // v["name"]

    std::string function(std::string name); // F["name"]

    std::string number(double value);

    std::string string(std::string value);
};
