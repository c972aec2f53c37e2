// Collaborator interfaces for the chunk engine. The engine never talks to a guest language directly; it goes through these.
// The Lua backend (include/lua) implements all of them, the tests implement fakes.
#pragma once
#include <string>
#include <vector>
#include <cstdint>


typedef uint64_t ValueHandle; // generation of the last produced value. Every evaluated expression gets a fresh one, even if it's equal in content
// to the last one. 0 means nothing has been produced yet.

inline bool sameHandle(ValueHandle a, ValueHandle b) {
    return a == b;
}


struct TopLevelNode {
    int line; // 1-based line the statement starts on
    int decorationLine = 0; // line of the first attached annotation, only meaningful if hasDecoration
    bool hasDecoration = false;
};


struct Parser {
    virtual ~Parser() {}

    // split a whole chunk into its top-level statements, in source order.
    // returns false (and fills error) if the source doesn't parse.
    virtual bool parse(const std::string& source, std::vector<TopLevelNode>& nodes, std::string& error) = 0;
};


enum class EvalMode {
    Exec,  // run as statements, never display a value
    Single // a bare trailing expression becomes the last produced value and is displayed
};


struct EvalResult {
    std::string text; // everything written to the session's stdout during the call
    bool raised = false;
    std::string message; // set if raised
};


struct HostBinding { // a host-side variable pushed into the session before every chunk
    std::string name;
    std::string value;
};


struct FigureSize {
    double width; // inches
    double height;
    int dpi;
};


struct GraphicsSink { // whatever the guest's "display current graphic" call ends up in
    virtual ~GraphicsSink() {}

    virtual void show() = 0;
};


struct GraphicsBackend {
    virtual ~GraphicsBackend() {}

    // render the current graphic surface to path. returns the artifact handle, or an empty string on failure.
    virtual std::string render(const std::string& path, FigureSize size) = 0;

    virtual void clearSurface() = 0;
};


struct Interpreter {
    virtual ~Interpreter() {}

    virtual EvalResult evalUnit(const std::string& text, EvalMode mode) = 0;

    virtual ValueHandle lastValue() = 0;

    virtual bool lastValueIsGraphic() = 0; // also true for a length-one container holding a graphic

    virtual GraphicsSink* graphicsSink() = 0;

    virtual void setGraphicsSink(GraphicsSink* sink) = 0; // NULL detaches

    virtual void bindHostValues(const std::vector<HostBinding>& bindings) = 0;

    virtual std::string name() = 0; // used to check engine.path requests against the interpreter that's actually loaded
};
