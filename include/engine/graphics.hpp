// GraphicsCapture turns display calls into figure files. It is installed as the interpreter's graphics sink for exactly one chunk.
#pragma once
#include <deque>
#include <functional>
#include <string>
#include <vector>
#include <engine/interpreter.hpp>
#include <engine/execution.hpp>


struct GraphicsCapture : GraphicsSink {
    GraphicsBackend& backend;
    FigureSize size;
    std::function<std::string(int)> figurePath; // host decides where figure n (1-based, per chunk) lives
    std::vector<std::string>& warnings;

    std::deque<std::string> pending; // artifacts not yet placed in the output, FIFO
    int counter = 0;

    GraphicsCapture(GraphicsBackend& b, FigureSize s, std::function<std::string(int)> path, std::vector<std::string>& w);

    void show(); // render, clear the surface, queue the artifact

    // called after every unit. If the unit produced a new graphic value, its text is dropped, and if it's the last unit
    // we display it as though the user had called show() themselves.
    void handleOutput(Interpreter& interpreter, ExecutionResult& result, bool finalUnit);
};


struct ScopedGraphicsSink { // restores whatever sink was there before, on every exit path
    Interpreter& interpreter;
    GraphicsSink* previous;

    ScopedGraphicsSink(Interpreter& interp, GraphicsSink* sink);

    ~ScopedGraphicsSink();
};
