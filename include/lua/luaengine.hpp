// The LuaJIT side of the engine: a persistent lua_State that every chunk runs in, and a parser that finds statement boundaries in it.
#pragma once
#include <luajit-2.1/lua.hpp>
#include <string>
#include <vector>
#include <engine/interpreter.hpp>
#include <lua/plot.hpp>


struct LuaInterpreter : Interpreter {
    lua_State* lua;
    PlotSurface surface; // what `plot` draws on
    GraphicsSink* sink = NULL; // where plot.show() goes; NULL outside of a chunk
    std::string captured; // stdout of the unit currently running
    ValueHandle generation = 0;
    int lastRef = LUA_NOREF; // registry reference to the last produced value

    LuaInterpreter();

    ~LuaInterpreter();

    EvalResult evalUnit(const std::string& text, EvalMode mode);

    ValueHandle lastValue();

    bool lastValueIsGraphic();

    GraphicsSink* graphicsSink();

    void setGraphicsSink(GraphicsSink* s);

    void bindHostValues(const std::vector<HostBinding>& bindings);

    std::string name();

    bool isArtist(int index); // is the value at index a plot artist?

private:
    void openPlot();

    void captureOutput();
};


// rewrites the top-level `local` declarations of one unit into assignments to globals, so they outlive the unit like they would
// have in one big chunk. locals inside functions and blocks are left alone.
std::string promoteLocals(const std::string& code);


struct LuaParser : Parser {
    lua_State* lua; // borrowed from the interpreter; we only ever compile with it, never run anything

    LuaParser(lua_State* L);

    bool parse(const std::string& source, std::vector<TopLevelNode>& nodes, std::string& error);

    bool compiles(const std::string& code, std::string* error = NULL);
};
