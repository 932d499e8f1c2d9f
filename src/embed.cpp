#include <dumblang.hpp>
#include <parser.hpp>
#include <mapview.hpp>
#include <memory>


Program* parseSource(std::string source) {
    Parser parser(MapView(source.c_str(), source.size())); // source outlives the parser, so borrowing is fine
    return parser.parse();
}

BuiltinTable layerBuiltins(BuiltinTable base, BuiltinTable overrides) {
    for (auto& entry : overrides) {
        base[entry.first] = entry.second;
    }
    return base;
}

ObjectRef evaluate(std::string source, ObjectRef entry, BuiltinTable builtins, RunFlags flags) {
    static StdioWriteOutput console(stdout);
    std::unique_ptr<Program> program(parseSource(source));
    Evaluator evaluator(program.get(), layerBuiltins(defaultBuiltins(console, stdin, flags), builtins), flags);
    ObjectRef ret = evaluator.run(entry);
    console.flush();
    return ret;
}

std::string renderLua(Program* program, RunFlags flags) {
    StringWriteOutput out;
    LuaWriter writer(out, flags);
    program -> emit(&writer);
    return out.content;
}
