#include <types/CodeChunk.hpp>
#include <types/Document.hpp>
#include <session.hpp>
#include <cstdio>


CodeChunk::CodeChunk(Session* session, RawOptions opts, std::vector<std::string> source) : Node(session), options(opts), code(source) {}

void CodeChunk::render(WeaveWriter* out) {
    RawOptions raw = options;
    std::string label;
    for (auto& option : raw) {
        if (option.first == "label") {
            label = option.second.string;
        }
    }
    if (label.size() == 0) {
        parent -> unnamedChunks ++;
        label = "unnamed-chunk-" + std::to_string(parent -> unnamedChunks);
        raw.insert(raw.begin(), { "label", OptionValue::fromString(label) });
    }
    printf(CHUNK "%s:%d: running '%s'\n", parent -> name.c_str(), line, label.c_str());
    ChunkResult result = session -> runChunk(raw, code, parent -> figurePrefix());
    if (result.fatal) {
        printf(ERROR "%s:%d: chunk '%s' failed: %s\n", parent -> name.c_str(), line, result.options.label.c_str(), result.error.c_str());
        printf("\tRendering of %s stops here.\n", parent -> name.c_str());
        parent -> failed = true;
        return;
    }
    writeResult(out, result, parent);
}

void CodeChunk::writeResult(WeaveWriter* out, const ChunkResult& result, Document* doc) {
    bool first = true;
    auto separate = [&]() { // blank line between blocks, not after the last one
        if (!first) {
            out -> write("\n");
        }
        first = false;
    };
    for (const OutputItem& item : result.items) {
        separate();
        if (item.kind == OutputItem::SourceEcho) {
            out -> fence("lua", item.content);
        }
        else if (item.kind == OutputItem::TextOutput) {
            out -> fence("", item.content);
        }
        else if (item.kind == OutputItem::ErrorOutput) {
            out -> fence("", "Error: " + item.content);
        }
        else {
            out -> newline();
            out -> write("![" + result.options.label + "](" + (doc == NULL ? item.content : doc -> relativeToOutput(item.content)) + ")\n");
        }
    }
    if (result.options.warning) {
        for (const std::string& warning : result.warnings) {
            separate();
            out -> fence("", "Warning: " + warning);
        }
    }
}
