#pragma once
#include <vector>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR   "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "


struct Node; // forward-declarations for everything. this is useful because it means we don't have to import those files, decreasing the dependency web
struct Expr; // (which makes builds faster)
struct Statement;
struct Program;
struct Function;
struct Block;
struct RuntimeObject;
struct RunFlags;
struct Scope;
struct Evaluator;
struct LuaWriter;
struct WriteOutput;
class MapView;
