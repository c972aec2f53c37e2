// "view" a memory map
// provides reference counted unmapping, line-at-a-time consumption, view slicing, etc
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>


struct MapView {
    char* map;
    size_t length; // authoritative length of the WHOLE MEMORY MAP
    size_t start; // starting position of this MapView's slice of the memory map
    size_t end; // ending position of this MapView's slice of the memory map
    int* rCount; // counts references to the underlying memory map
    int fd; // file descriptor of the map, -1 if there isn't one
    bool mapped; // false for views over memory we don't own (fromString)
    int line = 1; // 1-based line number of `start`, for error messages

    void init(int, char* mm, size_t size);

    MapView(std::string filename);

    static MapView fromString(const char* data, size_t size); // the caller keeps the data alive for as long as any view of it

    MapView(const MapView& m);

    MapView& operator=(const MapView& m);

    ~MapView();

    bool isValid();

    int64_t len();

    MapView slice(size_t from, size_t len);

    std::string toString(); // COPIES! TRY TO AVOID IT!

    const char* cbuf(); // get the "underlying c buffer"
    // since this is a MapView, the c buffer will be inside a memory map

    MapView consumeLine(); // consume up to and including the next newline, returned as a child MapView (which keeps the newline)

private:
    MapView();

    void release();
};
