// fillDocument: splits a .lmd file into prose and Lua chunks.
#include <defs.h>
#include <mapview.hpp>
#include <chunkheader.hpp>
#include <util.hpp>
#include <types/Document.hpp>
#include <types/PlainText.hpp>
#include <types/CodeChunk.hpp>
#include <cstdio>


static std::string lineText(MapView line) { // without the newline (or a \r\n)
    std::string ret = line.toString();
    while (ret.size() > 0 && (ret[ret.size() - 1] == '\n' || ret[ret.size() - 1] == '\r')) {
        ret.pop_back();
    }
    return ret;
}

int fillDocument(MapView& map, Document* doc, Session* session) {
    MapView prose = map; // start of the prose we haven't handed off yet
    size_t proseLen = 0;
    int proseLine = map.line;
    while (map.len() > 0) {
        int headerLine = map.line;
        MapView raw = map.consumeLine();
        std::string header = lineText(raw);
        if (!isLuaChunkHeader(header)) {
            proseLen += raw.len();
            continue;
        }
        if (proseLen > 0) {
            PlainText* text = new PlainText(session, prose.slice(0, proseLen));
            text -> line = proseLine;
            doc -> addChild(text);
        }
        header = trim(header);
        std::string inner = header.substr(4, header.size() - 5); // between ```{ and }
        RawOptions options;
        std::string error;
        if (!parseChunkHeader(inner, options, error)) {
            printf(WARNING "%s:%d: %s. Options after that point are ignored.\n", doc -> name.c_str(), headerLine, error.c_str());
        }
        std::vector<std::string> code;
        bool closed = false;
        while (map.len() > 0) {
            std::string line = lineText(map.consumeLine());
            if (trim(line) == "```") {
                closed = true;
                break;
            }
            code.push_back(line);
        }
        CodeChunk* chunk = new CodeChunk(session, options, code);
        chunk -> line = headerLine;
        doc -> addChild(chunk);
        if (!closed) {
            printf(WARNING "%s:%d: chunk is never closed; it runs to the end of the file.\n", doc -> name.c_str(), headerLine);
            return FILLDOC_EXIT_UNCLOSED;
        }
        prose = map;
        proseLen = 0;
        proseLine = map.line;
    }
    if (proseLen > 0) {
        PlainText* text = new PlainText(session, prose.slice(0, proseLen));
        text -> line = proseLine;
        doc -> addChild(text);
    }
    return FILLDOC_EXIT_EOF;
}
