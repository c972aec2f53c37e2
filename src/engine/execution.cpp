#include <engine/execution.hpp>
#include <util.hpp>


ExecutionSession::ExecutionSession(Interpreter& interp, bool capture) : interpreter(interp), captureErrors(capture) {}

EvalMode ExecutionSession::modeFor(const std::string& text) {
    size_t i = text.size();
    while (i > 0 && isWhitespace(text[i - 1])) {
        i --;
    }
    if (i > 0 && text[i - 1] == ';') {
        return EvalMode::Exec;
    }
    return EvalMode::Single;
}

ExecutionResult ExecutionSession::execute(const SourceUnit& unit) {
    ExecutionResult result;
    ValueHandle previous = interpreter.lastValue();
    EvalResult eval = interpreter.evalUnit(unit.text, modeFor(unit.text));
    ValueHandle current = interpreter.lastValue();
    result.text = eval.text;
    result.valueChanged = !sameHandle(previous, current);
    if (eval.raised) {
        result.isError = true;
        result.message = eval.message;
        result.fatal = !captureErrors;
    }
    return result;
}
