// Session is the one thing that lives for the whole run: the Lua interpreter every chunk of every document shares, root configuration
// data, and the input and output directories. Every Node contains a pointer to it.
#pragma once
#include <defs.h>
#include <string>
#include <vector>
#include <fileman.hpp>
#include <engine/engine.hpp>
#include <lua/luaengine.hpp>


struct ConfigEntry { // -c name value; shows up in Lua as host.name
    std::string name;
    std::string content;
};


struct Session {
    std::vector<ConfigEntry> config;
    FileMan input;
    FileMan output;
    bool inDocumentBuild = true; // false for standalone (-i) runs, which capture errors by default
    LuaInterpreter interpreter;
    LuaParser parser;
    SvgBackend backend;

    Session(std::string inDir, std::string outDir);

    // run one chunk against the shared interpreter. figure n of the chunk goes to <figurePrefix>-<label>-<n>.<dev>
    ChunkResult runChunk(const RawOptions& raw, const std::vector<std::string>& code, std::string figurePrefix);

    std::string toOutput(std::string path); // where an input file's rendering goes, relative to the output directory

    MapView open(std::string path);

    FileWriteOutput create(std::string path);
};
