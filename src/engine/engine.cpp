#include <engine/engine.hpp>
#include <engine/splitter.hpp>
#include <engine/execution.hpp>
#include <engine/graphics.hpp>
#include <defs.h>
#include <util.hpp>
#include <cstdio>


static void diagnostic(ChunkResult& result, std::string message) {
    printf(WARNING "%s\n", message.c_str());
    result.warnings.push_back(message);
}

static void synchronizeBefore(ChunkHost& host) {
    host.interpreter.bindHostValues(host.bindings);
}

static void synchronizeAfter(ChunkHost& host) { // nothing comes back out of the session automatically; the host gets a look if it wants one
    if (host.afterChunk) {
        host.afterChunk();
    }
}


struct SessionBarrier { // synchronizes on the way in, and on every way out
    ChunkHost& host;

    SessionBarrier(ChunkHost& h) : host(h) {
        synchronizeBefore(host);
    }

    ~SessionBarrier() {
        synchronizeAfter(host);
    }
};

ChunkResult runChunk(ChunkHost& host, const RawOptions& raw, const std::vector<std::string>& code) {
    ChunkResult result;
    result.options = validateOptions(raw, result.warnings);
    result.options.code = code;
    ChunkOptions& options = result.options;

    if (!options.eval) { // source goes out verbatim, nothing else happens
        if (options.echo && code.size() > 0) {
            result.items.push_back(OutputItem{ OutputItem::SourceEcho, extractLines(code, 1, code.size()) });
        }
        return result;
    }

    if (options.enginePath.size() > 0) {
        std::string requested = leafName(options.enginePath);
        std::string actual = host.interpreter.name();
        if (requested.compare(0, actual.size(), actual) != 0) { // we can't swap interpreters under a live session
            diagnostic(result, "cannot honor request to use interpreter " + options.enginePath + " [" + actual + " already loaded]");
        }
    }
    if (options.dev != "svg") {
        diagnostic(result, "graphics device '" + options.dev + "' not supported by the lua engine; using svg");
        options.dev = "svg";
    }

    std::vector<SourceUnit> units;
    std::string parseError;
    if (!splitStatements(code, host.parser, units, parseError)) {
        result.fatal = true;
        result.error = parseError;
        return result;
    }
    if (units.size() == 0) {
        return result;
    }

    bool captureErrors = options.error == ChunkOptions::Capture || !host.inDocumentBuild;

    SessionBarrier barrier(host);
    GraphicsCapture capture(host.backend, FigureSize{ options.figWidth, options.figHeight, options.dpi }, [&](int n) {
        return host.figurePath(options, n);
    }, result.warnings);
    ScopedGraphicsSink sink(host.interpreter, &capture);
    ExecutionSession session(host.interpreter, captureErrors);
    OutputMultiplexer mux(options);

    for (size_t i = 0; i < units.size(); i ++) {
        ExecutionResult executed = session.execute(units[i]);
        if (executed.fatal) {
            result.fatal = true;
            result.error = executed.message;
            return result;
        }
        capture.handleOutput(host.interpreter, executed, i == units.size() - 1);
        if (!mux.consume(units[i], executed, capture.pending)) {
            break;
        }
    }
    result.items = mux.finish();
    return result;
}
