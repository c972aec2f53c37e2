#include <engine/graphics.hpp>
#include <defs.h>
#include <cstdio>


GraphicsCapture::GraphicsCapture(GraphicsBackend& b, FigureSize s, std::function<std::string(int)> path, std::vector<std::string>& w) :
    backend(b), size(s), figurePath(path), warnings(w) {}

void GraphicsCapture::show() {
    counter ++;
    std::string path = figurePath(counter);
    std::string artifact = backend.render(path, size);
    backend.clearSurface();
    if (artifact.size() == 0) {
        printf(ERROR "Couldn't render figure %d to %s. It will be left out.\n", counter, path.c_str());
        warnings.push_back("failed to render figure to " + path);
        return;
    }
    pending.push_back(artifact);
}

void GraphicsCapture::handleOutput(Interpreter& interpreter, ExecutionResult& result, bool finalUnit) {
    if (!result.valueChanged || !interpreter.lastValueIsGraphic()) {
        return;
    }
    if (finalUnit) {
        show();
    }
    result.text = ""; // the figure stands in for the value's printed form
}


ScopedGraphicsSink::ScopedGraphicsSink(Interpreter& interp, GraphicsSink* sink) : interpreter(interp) {
    previous = interpreter.graphicsSink();
    interpreter.setGraphicsSink(sink);
}

ScopedGraphicsSink::~ScopedGraphicsSink() {
    interpreter.setGraphicsSink(previous);
}
