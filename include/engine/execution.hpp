#pragma once
#include <string>
#include <engine/interpreter.hpp>
#include <engine/splitter.hpp>


struct ExecutionResult {
    std::string text; // captured stdout
    bool valueChanged = false;
    bool isError = false;
    std::string message; // the failure, if isError
    bool fatal = false; // isError and errors aren't being captured: the chunk has to stop right here
};


struct ExecutionSession { // runs units against the persistent interpreter, one at a time, in order
    Interpreter& interpreter;
    bool captureErrors;

    ExecutionSession(Interpreter& interp, bool capture);

    static EvalMode modeFor(const std::string& text); // a trailing ; means "don't show me the value"

    ExecutionResult execute(const SourceUnit& unit);
};
