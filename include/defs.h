#pragma once
#include <vector>

#define INFO      "\033[32m[   INFO   ]\033[0m "
#define ERROR     "\033[1;31m[   ERROR  ]\033[0m "
#define WARNING   "\033[33m[  WARNING ]\033[0m "
#define CHUNK     "\033[34m[   CHUNK  ]\033[0m "

#define FILLDOC_EXIT_EOF      0
#define FILLDOC_EXIT_UNCLOSED 1 // a chunk fence was never closed; the chunk ran to the end of the file


struct Node; // forward-declarations for everything. this is useful because it means we don't have to import those files, decreasing the dependency web
struct Document; // (which makes builds faster)
struct MapView; // ideally this file will be changed far less frequently than the other headers
struct FileWriteOutput;
struct StringWriteOutput;
struct WeaveWriter;
struct Session;


int fillDocument(MapView&, Document*, Session*);
