#include <render.hpp>
#include <defs.h>
#include <cstdio>
#include <mapview.hpp>
#include <weavewriter.hpp>
#include <util.hpp>
#include <types/Document.hpp>
#include <types/PlainText.hpp>
#include <types/CodeChunk.hpp>


bool renderFile(std::string in, Session* session) { // returns false if the input couldn't be read, the output couldn't be written, or a chunk failed
    std::string out = session -> toOutput(in);
    printf(INFO "Rendering %s to %s.\n", in.c_str(), out.c_str());
    MapView map = session -> open(in);
    if (!map.isValid()) {
        return false; // MapView already said why
    }
    Document* doc = new Document(session);
    doc -> name = in;
    doc -> outputPath = session -> output.transmuted(out);
    if (endsWith(in, ".lmd")) {
        if (fillDocument(map, doc, session) == FILLDOC_EXIT_UNCLOSED) {
            printf("\tThe rest of %s was read as code.\n", in.c_str());
        }
    }
    else {
        doc -> addChild(new PlainText(session, map));
    }
    FileWriteOutput fOut = session -> create(out);
    if (fOut.isValid()) {
        WeaveWriter stream(fOut);
        doc -> render(&stream);
    }
    bool ok = fOut.isValid() && !doc -> failed;
    delete doc;
    return ok;
}


bool runStandalone(std::string file, Session* session) { // errors are captured, figures still go to the output directory
    MapView map = session -> open(file);
    if (!map.isValid()) {
        return false;
    }
    RawOptions options;
    options.push_back({ "label", OptionValue::fromString(stem(file)) });
    ChunkResult result = session -> runChunk(options, splitLines(map.toString()), session -> output.transmuted("figure/" + stem(file)));
    if (result.fatal) {
        printf(ERROR "%s: %s\n", file.c_str(), result.error.c_str());
        return false;
    }
    StringWriteOutput text;
    WeaveWriter stream(text);
    CodeChunk::writeResult(&stream, result, NULL);
    fwrite(text.content.c_str(), 1, text.content.size(), stdout);
    return true;
}
