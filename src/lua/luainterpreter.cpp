// LuaInterpreter: the session every chunk runs in. One lua_State for the life of the process; globals are what persists between units
// and chunks, so a unit's top-level locals are promoted to globals before it runs.
#include <lua/luaengine.hpp>
#include <defs.h>
#include <util.hpp>
#include <cstdio>


#define ARTIST_META "luaweave.artist"
#define STDOUT_META "luaweave.stdout"


struct Artist { // userdata behind everything plot.line() and friends return
    size_t series;
    PlotSeries::Kind kind;
};


static LuaInterpreter* self(lua_State* L) {
    return (LuaInterpreter*)lua_touserdata(L, lua_upvalueindex(1));
}

static void appendValues(lua_State* L, std::string& out, int from, int to) { // print()-style: tostring'd, tab separated, newline at the end
    lua_getglobal(L, "tostring");
    for (int i = from; i <= to; i ++) {
        lua_pushvalue(L, -1);
        lua_pushvalue(L, i);
        lua_call(L, 1, 1);
        size_t len;
        const char* s = lua_tolstring(L, -1, &len);
        if (i > from) {
            out += '\t';
        }
        if (s != NULL) {
            out.append(s, len);
        }
        lua_pop(L, 1);
    }
    lua_pop(L, 1);
    out += '\n';
}

static int capturedPrint(lua_State* L) {
    appendValues(L, self(L) -> captured, 1, lua_gettop(L));
    return 0;
}

static void appendStrings(lua_State* L, std::string& out, int from) {
    int n = lua_gettop(L);
    for (int i = from; i <= n; i ++) {
        size_t len;
        const char* s = luaL_checklstring(L, i, &len);
        out.append(s, len);
    }
}

static int capturedWrite(lua_State* L) { // io.write
    appendStrings(L, self(L) -> captured, 1);
    return 0;
}

static int stdoutWrite(lua_State* L) { // io.stdout:write(...), returns the file so calls chain
    luaL_checkudata(L, 1, STDOUT_META);
    appendStrings(L, self(L) -> captured, 2);
    lua_settop(L, 1);
    return 1;
}

static int stdoutNothing(lua_State* L) { // flush, setvbuf: there's no buffer of our own to worry about
    luaL_checkudata(L, 1, STDOUT_META);
    lua_pushboolean(L, 1);
    return 1;
}

static int stdoutClose(lua_State* L) {
    luaL_checkudata(L, 1, STDOUT_META);
    lua_pushnil(L);
    lua_pushliteral(L, "cannot close standard file");
    return 2;
}

static int stdoutToString(lua_State* L) {
    lua_pushliteral(L, "file (stdout)");
    return 1;
}

static bool isStdout(lua_State* L, int index) {
    if (!lua_getmetatable(L, index)) {
        return false;
    }
    luaL_getmetatable(L, STDOUT_META);
    bool ret = lua_rawequal(L, -1, -2);
    lua_pop(L, 2);
    return ret;
}

static int capturedOutput(lua_State* L) { // io.output: with no argument, or when handed stdout back, the default output is our stdout
    if (lua_isnoneornil(L, 1) || isStdout(L, 1)) {
        lua_getglobal(L, "io");
        lua_getfield(L, -1, "stdout");
        return 1;
    }
    lua_pushvalue(L, lua_upvalueindex(2)); // the real io.output, for redirecting to an actual file
    lua_insert(L, 1);
    lua_call(L, lua_gettop(L) - 1, LUA_MULTRET);
    return lua_gettop(L);
}

static int messageHandler(lua_State* L) {
    if (!lua_isstring(L, 1)) {
        lua_pushfstring(L, "(error object is a %s value)", luaL_typename(L, 1));
    }
    return 1;
}


static std::vector<double> numbers(lua_State* L, int index) {
    luaL_checktype(L, index, LUA_TTABLE);
    std::vector<double> ret;
    size_t n = lua_objlen(L, index);
    for (size_t i = 1; i <= n; i ++) {
        lua_rawgeti(L, index, i);
        if (!lua_isnumber(L, -1)) {
            luaL_error(L, "plot data must be numbers (element %d is a %s)", (int)i, luaL_typename(L, -1));
        }
        ret.push_back(lua_tonumber(L, -1));
        lua_pop(L, 1);
    }
    return ret;
}

static int addSeries(lua_State* L, PlotSeries::Kind kind) { // plot.<kind>(ys [, label]) or plot.<kind>(xs, ys [, label])
    LuaInterpreter* interp = self(L);
    PlotSeries s;
    s.kind = kind;
    int labelIndex = 2;
    if (lua_istable(L, 2)) {
        s.xs = numbers(L, 1);
        s.ys = numbers(L, 2);
        labelIndex = 3;
    }
    else {
        s.ys = numbers(L, 1);
        for (size_t i = 0; i < s.ys.size(); i ++) {
            s.xs.push_back(i + 1);
        }
    }
    if (s.xs.size() != s.ys.size()) {
        return luaL_error(L, "x and y must be the same length (%d and %d)", (int)s.xs.size(), (int)s.ys.size());
    }
    if (lua_isstring(L, labelIndex)) {
        s.label = lua_tostring(L, labelIndex);
    }
    interp -> surface.series.push_back(s);
    Artist* artist = (Artist*)lua_newuserdata(L, sizeof(Artist));
    artist -> series = interp -> surface.series.size() - 1;
    artist -> kind = kind;
    luaL_getmetatable(L, ARTIST_META);
    lua_setmetatable(L, -2);
    return 1;
}

static int plotLine(lua_State* L) {
    return addSeries(L, PlotSeries::Line);
}

static int plotPoints(lua_State* L) {
    return addSeries(L, PlotSeries::Points);
}

static int plotBars(lua_State* L) {
    return addSeries(L, PlotSeries::Bars);
}

static int plotTitle(lua_State* L) {
    self(L) -> surface.title = luaL_checkstring(L, 1);
    return 0;
}

static int plotXlabel(lua_State* L) {
    self(L) -> surface.xlabel = luaL_checkstring(L, 1);
    return 0;
}

static int plotYlabel(lua_State* L) {
    self(L) -> surface.ylabel = luaL_checkstring(L, 1);
    return 0;
}

static int plotShow(lua_State* L) { // returns nothing, so nothing gets echoed at the prompt
    LuaInterpreter* interp = self(L);
    if (interp -> sink != NULL) {
        interp -> sink -> show();
    }
    return 0;
}

static int plotClear(lua_State* L) {
    self(L) -> surface.clear();
    return 0;
}

static int artistToString(lua_State* L) {
    Artist* artist = (Artist*)luaL_checkudata(L, 1, ARTIST_META);
    const char* kind = artist -> kind == PlotSeries::Line ? "line" : (artist -> kind == PlotSeries::Points ? "points" : "bars");
    lua_pushfstring(L, "<plot.%s #%d>", kind, (int)artist -> series + 1);
    return 1;
}


LuaInterpreter::LuaInterpreter() {
    lua = lua_open();
    luaL_openlibs(lua);
    captureOutput();
    openPlot();
}

LuaInterpreter::~LuaInterpreter() {
    lua_close(lua);
}

void LuaInterpreter::captureOutput() {
    lua_pushlightuserdata(lua, this);
    lua_pushcclosure(lua, capturedPrint, 1);
    lua_setglobal(lua, "print");
    lua_getglobal(lua, "io");
    lua_pushlightuserdata(lua, this);
    lua_pushcclosure(lua, capturedWrite, 1);
    lua_setfield(lua, -2, "write");

    static const luaL_Reg methods[] = {
        { "write", stdoutWrite },
        { "flush", stdoutNothing },
        { "setvbuf", stdoutNothing },
        { "close", stdoutClose },
        { NULL, NULL }
    };
    luaL_newmetatable(lua, STDOUT_META);
    lua_createtable(lua, 0, 4); // __index
    for (const luaL_Reg* m = methods; m -> name != NULL; m ++) {
        lua_pushlightuserdata(lua, this);
        lua_pushcclosure(lua, m -> func, 1);
        lua_setfield(lua, -2, m -> name);
    }
    lua_setfield(lua, -2, "__index");
    lua_pushcfunction(lua, stdoutToString);
    lua_setfield(lua, -2, "__tostring");
    lua_pop(lua, 1);
    lua_newuserdata(lua, 1); // stands in for io.stdout; everything written to it lands in `captured`
    luaL_getmetatable(lua, STDOUT_META);
    lua_setmetatable(lua, -2);
    lua_setfield(lua, -2, "stdout");

    lua_pushlightuserdata(lua, this);
    lua_getfield(lua, -2, "output");
    lua_pushcclosure(lua, capturedOutput, 2);
    lua_setfield(lua, -2, "output");
    lua_pop(lua, 1);
}

void LuaInterpreter::openPlot() {
    luaL_newmetatable(lua, ARTIST_META);
    lua_pushcfunction(lua, artistToString);
    lua_setfield(lua, -2, "__tostring");
    lua_pop(lua, 1);

    static const luaL_Reg functions[] = {
        { "line", plotLine },
        { "points", plotPoints },
        { "bars", plotBars },
        { "title", plotTitle },
        { "xlabel", plotXlabel },
        { "ylabel", plotYlabel },
        { "show", plotShow },
        { "clear", plotClear },
        { NULL, NULL }
    };
    lua_createtable(lua, 0, 8); // "plot" table
    for (const luaL_Reg* f = functions; f -> name != NULL; f ++) {
        lua_pushlightuserdata(lua, this); // every plot function finds us through its upvalue
        lua_pushcclosure(lua, f -> func, 1);
        lua_setfield(lua, -2, f -> name);
    }
    lua_setglobal(lua, "plot");
}

EvalResult LuaInterpreter::evalUnit(const std::string& unit, EvalMode mode) {
    EvalResult result;
    std::string text = promoteLocals(unit);
    captured.clear();
    int base = lua_gettop(lua);
    lua_pushcfunction(lua, messageHandler);
    bool expression = false;
    if (mode == EvalMode::Single) { // try it as an expression first, like the interactive prompt does
        std::string asReturn = "return " + text;
        if (luaL_loadbuffer(lua, asReturn.c_str(), asReturn.size(), "=lua") == 0) {
            expression = true;
        }
        else {
            lua_pop(lua, 1);
        }
    }
    if (!expression && luaL_loadbuffer(lua, text.c_str(), text.size(), "=lua") != 0) {
        result.raised = true;
        result.message = lua_tostring(lua, -1);
        result.text = captured;
        lua_settop(lua, base);
        return result;
    }
    if (lua_pcall(lua, 0, LUA_MULTRET, base + 1) != 0) {
        result.raised = true;
        result.message = lua_tostring(lua, -1);
    }
    else if (expression && lua_gettop(lua) > base + 1 && !lua_isnil(lua, base + 2)) {
        lua_pushvalue(lua, base + 2);
        luaL_unref(lua, LUA_REGISTRYINDEX, lastRef);
        lastRef = luaL_ref(lua, LUA_REGISTRYINDEX);
        generation ++; // a fresh handle even if it's the same value as last time
        int count = lua_gettop(lua) - (base + 1);
        lua_pushlightuserdata(lua, this); // show it the way print() would; __tostring can raise, so this is protected too
        lua_pushcclosure(lua, capturedPrint, 1);
        lua_insert(lua, base + 2);
        if (lua_pcall(lua, count, 0, base + 1) != 0) {
            result.raised = true;
            result.message = lua_tostring(lua, -1);
        }
    }
    result.text = captured;
    captured.clear();
    lua_settop(lua, base);
    return result;
}

ValueHandle LuaInterpreter::lastValue() {
    return generation;
}

bool LuaInterpreter::isArtist(int index) {
    if (index < 0) {
        index = lua_gettop(lua) + index + 1;
    }
    if (!lua_getmetatable(lua, index)) {
        return false;
    }
    luaL_getmetatable(lua, ARTIST_META);
    bool ret = lua_rawequal(lua, -1, -2);
    lua_pop(lua, 2);
    return ret;
}

bool LuaInterpreter::lastValueIsGraphic() {
    if (lastRef == LUA_NOREF || lastRef == LUA_REFNIL) {
        return false;
    }
    lua_rawgeti(lua, LUA_REGISTRYINDEX, lastRef);
    bool graphic = isArtist(-1);
    if (!graphic && lua_istable(lua, -1) && lua_objlen(lua, -1) == 1) { // {plot.line(...)} counts too
        lua_rawgeti(lua, -1, 1);
        graphic = isArtist(-1);
        lua_pop(lua, 1);
    }
    lua_pop(lua, 1);
    return graphic;
}

GraphicsSink* LuaInterpreter::graphicsSink() {
    return sink;
}

void LuaInterpreter::setGraphicsSink(GraphicsSink* s) {
    sink = s;
}

void LuaInterpreter::bindHostValues(const std::vector<HostBinding>& bindings) {
    lua_createtable(lua, 0, bindings.size());
    for (const HostBinding& binding : bindings) {
        double number;
        if (toNumber(binding.value, number)) {
            lua_pushnumber(lua, number);
        }
        else {
            lua_pushlstring(lua, binding.value.c_str(), binding.value.size());
        }
        lua_setfield(lua, -2, binding.name.c_str());
    }
    lua_setglobal(lua, "host");
}

std::string LuaInterpreter::name() {
    return "luajit";
}
