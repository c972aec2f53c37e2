// "view" a memory map
// provides reference counted unmapping, line-at-a-time consumption, view slicing, etc

#include <mapview.hpp>
#include <fcntl.h>
#include <defs.h>
#include <sys/stat.h>
#include <sys/mman.h>
#include <unistd.h>
#include <cstdio>


void MapView::init(int file, char* mm, size_t size) {
    map = mm;
    length = size;
    start = 0;
    end = length;
    fd = file;
}

MapView::MapView() {
    rCount = new int(1);
    mapped = false;
    init(-1, NULL, 0);
}

MapView MapView::fromString(const char* data, size_t size) {
    MapView ret;
    ret.map = (char*)data;
    ret.length = size;
    ret.end = size;
    return ret;
}

MapView::MapView(std::string filename) {
    rCount = new int(1);
    mapped = true;
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
        printf(WARNING "%s has zero size and will not be rendered.\n", filename.c_str());
        return;
    }
    char* mm = (char*)mmap(0, sb.st_size, PROT_READ, MAP_SHARED, file, 0);
    if (mm == MAP_FAILED) {
        printf(ERROR "Can't load %s for memory mapping!\n", filename.c_str());
        perror("\tmmap");
        return;
    }
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
    line = m.line;
    (*rCount) ++;
}

MapView& MapView::operator=(const MapView& m) {
    if (this == &m) {
        return *this;
    }
    (*m.rCount) ++; // before release, in case we're the last reference to the same map
    release();
    map = m.map;
    length = m.length;
    start = m.start;
    end = m.end;
    rCount = m.rCount;
    fd = m.fd;
    mapped = m.mapped;
    line = m.line;
    return *this;
}

void MapView::release() {
    (*rCount) --;
    if (*rCount == 0) {
        delete rCount;
        if (mapped && map != NULL) {
            munmap(map, length);
        }
        if (fd != -1) {
            close(fd);
        }
    }
}

MapView::~MapView() {
    release();
}

bool MapView::isValid() {
    return map != NULL;
}

int64_t MapView::len() {
    return end - start;
}

MapView MapView::slice(size_t from, size_t len) {
    MapView ret(*this);
    ret.start = start + from;
    ret.end = start + from + len;
    return ret;
}

std::string MapView::toString() { // COPIES! TRY TO AVOID IT!
    if (map == NULL) {
        return "";
    }
    return std::string(map + start, end - start);
}

const char* MapView::cbuf() {
    return (map + start);
}

MapView MapView::consumeLine() {
    MapView ret = *this;
    while (start < end) {
        start ++;
        if (map[start - 1] == '\n') {
            line ++;
            break;
        }
    }
    ret.end = start;
    return ret;
}
