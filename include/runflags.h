// the runflags struct
#pragma once
struct RunFlags {
    bool frames = false; // give every activation a private store instead of sharing one store per function name
    // off by default: the shared store is how dumblang has always behaved, recursion and all
    int maxDepth = 1000; // deepest allowed nesting of user function calls
    bool prompts = true; // inpstr/inpnum announce themselves before blocking on input
};
