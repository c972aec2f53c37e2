#include <engine/multiplexer.hpp>


bool OutputItem::operator==(const OutputItem& other) const {
    return kind == other.kind && content == other.content;
}


OutputMultiplexer::OutputMultiplexer(const ChunkOptions& opts) : options(opts) {}

void OutputMultiplexer::route(OutputItem item) {
    if (options.results == ChunkOptions::Hold) {
        held.push_back(item);
    }
    else {
        outputs.push_back(item);
    }
}

bool OutputMultiplexer::consume(const SourceUnit& unit, const ExecutionResult& result, std::deque<std::string>& pendingGraphics) {
    if (result.text.size() == 0 && pendingGraphics.size() == 0 && !result.isError) { // nothing to see; this unit's source gets echoed with the next one
        return true;
    }
    if (options.echo && options.results != ChunkOptions::Hold) {
        outputs.push_back(OutputItem{ OutputItem::SourceEcho, extractLines(options.code, pendingSourceIndex, unit.endLine) });
    }
    if (options.include) {
        if (result.text.size() > 0) {
            route(OutputItem{ OutputItem::TextOutput, result.text });
        }
        for (std::string& artifact : pendingGraphics) {
            route(OutputItem{ OutputItem::GraphicArtifact, artifact });
        }
        if (result.isError) {
            route(OutputItem{ OutputItem::ErrorOutput, result.message });
        }
    }
    pendingGraphics.clear(); // flushed, whether or not anyone gets to see them
    pendingSourceIndex = unit.endLine + 1;
    if (options.error == ChunkOptions::Abort && result.isError) {
        hadError = true;
        return false;
    }
    return true;
}

std::vector<OutputItem> OutputMultiplexer::finish() {
    int n = options.code.size();
    if (hadError) { // an abort skips hold finalization too; whatever made it out before the error is all there is
        return outputs;
    }
    if (options.echo && options.results != ChunkOptions::Hold && pendingSourceIndex <= n) {
        outputs.push_back(OutputItem{ OutputItem::SourceEcho, extractLines(options.code, pendingSourceIndex, n) });
    }
    if (options.results != ChunkOptions::Hold) {
        return outputs;
    }
    outputs.push_back(OutputItem{ OutputItem::SourceEcho, extractLines(options.code, 1, n) }); // stands in for every echo the loop held back
    std::string text; // consecutive text merges into one block, everything else keeps its place
    bool hasText = false;
    for (OutputItem& item : held) {
        if (item.kind == OutputItem::TextOutput) {
            text += item.content;
            hasText = true;
            continue;
        }
        if (hasText) {
            outputs.push_back(OutputItem{ OutputItem::TextOutput, text });
            text.clear();
            hasText = false;
        }
        outputs.push_back(item);
    }
    if (hasText) {
        outputs.push_back(OutputItem{ OutputItem::TextOutput, text });
    }
    return outputs;
}
