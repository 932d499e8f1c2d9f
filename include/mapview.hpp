// "view" a memory map (or a plain buffer somebody else owns)
// provides reference counted unmapping and bounds-checked reads
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


class MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE MEMORY MAP
    size_t start; // starting position of this MapView's slice of the memory map
    size_t end; // ending position of this MapView's slice of the memory map
    int* rCount; // counts references to the underlying memory map
    int fd; // file descriptor of the map, -1 if we're viewing a borrowed buffer
    bool mapped = false; // did we mmap this ourselves? borrowed buffers are never unmapped

    void init(int, char* mm, size_t size);

    void release(); // drop our reference, unmapping and closing if it was the last one
public:
    MapView(const char* buffer, size_t size); // borrow a buffer. it has to outlive every view of it!

    MapView(std::string filename);

    bool isValid();

    MapView(const MapView& m);

    MapView& operator=(const MapView& m) = delete;

    char operator[](int64_t n); // EOF past the end

    void operator++(int);

    int64_t len();

    ~MapView();

    void skipTo(char until); // advance to the next until (or the end), leaving until in the view
};
