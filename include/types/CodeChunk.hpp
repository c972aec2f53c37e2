#pragma once

#include <node.hpp>
#include <string>
#include <vector>
#include <weavewriter.hpp>
#include <engine/engine.hpp>
#include <defs.h>


struct CodeChunk : Node { // a ```{lua} block. Runs when it's rendered, not when it's parsed, so chunks see each other's side effects in order.
    RawOptions options;
    std::vector<std::string> code;

    CodeChunk(Session* session, RawOptions opts, std::vector<std::string> source);

    void render(WeaveWriter* out);

    // turn a finished chunk into Markdown. doc may be NULL (standalone runs), in which case figure paths are written as-is.
    static void writeResult(WeaveWriter* out, const ChunkResult& result, Document* doc);
};
