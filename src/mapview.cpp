// "view" a memory map (or a plain buffer somebody else owns)
// provides reference counted unmapping and bounds-checked reads

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <stdio.h>


void MapView::init(int file, char* mm, size_t size) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
}

MapView::MapView(const char* buffer, size_t size) {
    rCount = new int(1);
    init(-1, (char*)buffer, size);
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    init(-1, NULL, 0);
    int file = open(filename.c_str(), O_RDONLY);
    fd = file; // so when the destructor calls it gets closed properly
    if (file == -1) {
        printf(ERROR "Can't open %s for memory mapping!\n", filename.c_str());
        perror("\topen");
        return;
    }
    struct stat sb;
    if (fstat(file, &sb)) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tfstat");
        return;
    }
    if (sb.st_size == 0) {
        printf(WARNING "%s is empty. There's nothing to run.\n", filename.c_str());
        return;
    }
    char* mm = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (mm == MAP_FAILED) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
    mapped = true;
    init(file, mm, sb.st_size);
}

MapView::MapView(const MapView& m) {
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    mapped = m.mapped;
    (*rCount) ++;
}

bool MapView::isValid() {
    return map != NULL;
}

char MapView::operator[](int64_t n) {
    if (n < 0 || n >= len()) {
        return EOF;
    }
    return map[start + n];
}

void MapView::operator++(int) {
    if (start < end) {
        start ++;
    }
}

int64_t MapView::len() {
    return end - start;
}

MapView::~MapView() {
    release();
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (mapped) {
            munmap(map, length);
        }
        if (fd != -1) {
            close(fd);
        }
    }
}

void MapView::skipTo(char until) {
    while (start < end && map[start] != until) {
        start ++;
    }
}
