// everything a host program needs to embed dumblang
#pragma once
#include <defs.h>
#include <errors.hpp>
#include <runflags.h>
#include <evaluator.hpp>
#include <luawriter.hpp>
#include <luahost.hpp>
#include <runtime/types.hpp>
#include <types/Program.hpp>
#include <string>


Program* parseSource(std::string source); // caller owns the Program

// parse and run. builtins are layered over the defaults, which talk to stdout and stdin.
ObjectRef evaluate(std::string source, ObjectRef entry, BuiltinTable builtins = BuiltinTable(), RunFlags flags = RunFlags());

std::string renderLua(Program* program, RunFlags flags = RunFlags());

BuiltinTable layerBuiltins(BuiltinTable base, BuiltinTable overrides); // overrides win
