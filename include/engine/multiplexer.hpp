// OutputMultiplexer: folds per-unit results into the order a reader of a live session would have seen them in.
#pragma once
#include <deque>
#include <string>
#include <vector>
#include <engine/options.hpp>
#include <engine/execution.hpp>
#include <engine/splitter.hpp>


struct OutputItem {
    enum Kind {
        SourceEcho,
        TextOutput,
        GraphicArtifact,
        ErrorOutput
    } kind;
    std::string content; // source, text, artifact handle or error message

    bool operator==(const OutputItem& other) const;
};


struct OutputMultiplexer {
    const ChunkOptions& options;
    int pendingSourceIndex = 1; // first line that hasn't been echoed yet
    bool hadError = false; // bailed out on an error with error = abort
    std::vector<OutputItem> outputs;
    std::vector<OutputItem> held; // results = hold only

    OutputMultiplexer(const ChunkOptions& opts);

    // returns false when the chunk should stop (error bailout)
    bool consume(const SourceUnit& unit, const ExecutionResult& result, std::deque<std::string>& pendingGraphics);

    std::vector<OutputItem> finish(); // leftover echo and held output. call once.

private:
    void route(OutputItem item);
};
