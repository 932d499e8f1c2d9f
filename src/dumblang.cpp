/* dumblang

    A tiny dynamically typed language: functions of zero or one argument, numbers, strings and arrays, while and if/else.
    Programs run either on the tree-walking evaluator or, rendered to Lua, inside LuaJIT.
*/

#include <defs.h>
#include <stdio.h>
#include <string.h>
#include <stdlib.h>
#include <fcntl.h>
#include <unistd.h>
#include <string>
#include <memory>
#include <mapview.hpp>
#include <parser.hpp>
#include <util.hpp>
#include <dumblang.hpp>


static bool needsValue(int i, int argc, char** argv) {
    if (i + 1 >= argc) {
        printf(ERROR "%s needs a value\n", argv[i]);
        return false;
    }
    return true;
}


int main(int argc, char** argv) {
    std::string file = "";
    std::string outputFile = "";
    std::string entryText = "0";
    RunFlags flags;
    bool emitSource = false;
    bool runLua = false;
    bool dumpAst = false;
    bool quiet = false;
    for (int i = 1; i < argc; i ++) {
        if (strcmp(argv[i], "--emit-source") == 0) {
            emitSource = true;
        }
        else if (strcmp(argv[i], "--run-lua") == 0) {
            runLua = true;
        }
        else if (strcmp(argv[i], "--dump-ast") == 0) {
            dumpAst = true;
        }
        else if (strcmp(argv[i], "--frames") == 0) {
            flags.frames = true;
        }
        else if (strcmp(argv[i], "--no-prompts") == 0) {
            flags.prompts = false;
        }
        else if (strcmp(argv[i], "-q") == 0) {
            quiet = true;
        }
        else if (strcmp(argv[i], "-o") == 0) {
            if (!needsValue(i, argc, argv)) {
                return 1;
            }
            i ++;
            outputFile = argv[i];
        }
        else if (strcmp(argv[i], "-e") == 0) {
            if (!needsValue(i, argc, argv)) {
                return 1;
            }
            i ++;
            entryText = argv[i];
        }
        else if (strcmp(argv[i], "-d") == 0) {
            if (!needsValue(i, argc, argv)) {
                return 1;
            }
            i ++;
            double depth;
            if (!parseNumber(argv[i], &depth) || depth < 1) {
                printf(ERROR "Bad maximum depth %s\n", argv[i]);
                return 1;
            }
            flags.maxDepth = (int)depth;
        }
        else if (strcmp(argv[i], "run") == 0 && file == "") { // `dumblang run x.dl` is the same as `dumblang x.dl`
            continue;
        }
        else if (file == "") {
            file = argv[i];
        }
        else {
            printf(ERROR "Unexpected argument %s\n", argv[i]);
            return 1;
        }
    }
    if (!quiet && !(emitSource && outputFile == "")) { // don't mix the banner into Lua on stdout
        printf("\033[1mdumblang v1.0\033[0m\n");
    }
    if (file == "") {
        printf(ERROR "No source file given.\n\tusage: dumblang [run] <file> [--emit-source [-o out]] [--run-lua] [--dump-ast] [--frames] [-d depth] [-e entry] [--no-prompts] [-q]\n");
        return 1;
    }
    MapView source(file);
    if (!source.isValid()) {
        return 1; // MapView already complained
    }
    ObjectRef entry;
    double number;
    if (parseNumber(entryText, &number)) {
        entry = makeNumber(number);
    }
    else {
        entry = makeString(entryText);
    }

    StdioWriteOutput console(stdout);
    try {
        Parser parser(source);
        std::unique_ptr<Program> program(parser.parse());
        if (dumpAst) {
            program -> pTree();
        }
        if (emitSource) {
            if (outputFile == "") {
                LuaWriter writer(console, flags);
                program -> emit(&writer);
                console.flush();
                return 0;
            }
            int fd = open(outputFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd == -1) {
                printf(ERROR "Couldn't open %s for writing.\n", outputFile.c_str());
                perror("\topen");
                return 1;
            }
            FileWriteOutput out(fd);
            LuaWriter writer(out, flags);
            program -> emit(&writer);
            if (!quiet) {
                printf(INFO "Wrote Lua to %s.\n", outputFile.c_str());
            }
            return 0;
        }
        if (dumpAst) {
            return 0;
        }
        ObjectRef result;
        if (runLua) {
            LuaHost host(defaultBuiltins(console, stdin, flags));
            result = host.run(renderLua(program.get(), flags), entry);
        }
        else {
            Evaluator evaluator(program.get(), defaultBuiltins(console, stdin, flags), flags);
            result = evaluator.run(entry);
        }
        console.flush();
        if (!quiet) {
            printf(INFO "main returned %s\n", result -> toString().c_str());
        }
    } catch (DslError& e) {
        console.flush();
        if (e.line > 0) {
            printf(ERROR "%s error on line %d: %s\n", DslError::kindName(e.kind), e.line, e.message.c_str());
        }
        else {
            printf(ERROR "%s error: %s\n", DslError::kindName(e.kind), e.message.c_str());
        }
        return 1;
    }
    return 0;
}
