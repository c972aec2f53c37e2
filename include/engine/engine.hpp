// The chunk driver. One call runs one chunk start to finish against a persistent interpreter.
#pragma once
#include <functional>
#include <string>
#include <vector>
#include <engine/interpreter.hpp>
#include <engine/options.hpp>
#include <engine/multiplexer.hpp>


struct ChunkHost { // everything a chunk needs from the process that owns the session
    Interpreter& interpreter;
    Parser& parser;
    GraphicsBackend& backend;
    std::vector<HostBinding> bindings; // pushed into the session before the first unit
    bool inDocumentBuild = true; // standalone runs capture errors by default so a typo doesn't kill the session
    std::function<std::string(const ChunkOptions&, int)> figurePath;
    std::function<void()> afterChunk; // optional. runs once after the units of every chunk that got that far, fatal or not
};


struct ChunkResult {
    ChunkOptions options; // as validated
    std::vector<OutputItem> items;
    std::vector<std::string> warnings;
    bool fatal = false; // parse error, or a failure with errors not captured. items holds nothing useful.
    std::string error;
};


ChunkResult runChunk(ChunkHost& host, const RawOptions& raw, const std::vector<std::string>& code);
