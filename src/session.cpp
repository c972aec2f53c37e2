#include <session.hpp>


Session::Session(std::string inDir, std::string outDir) : input(inDir, false), output(outDir, true), parser(interpreter.lua), backend(interpreter.surface) {}

ChunkResult Session::runChunk(const RawOptions& raw, const std::vector<std::string>& code, std::string figurePrefix) {
    ChunkHost host{ interpreter, parser, backend };
    for (ConfigEntry& entry : config) {
        host.bindings.push_back(HostBinding{ entry.name, entry.content });
    }
    host.inDocumentBuild = inDocumentBuild;
    host.figurePath = [&](const ChunkOptions& options, int n) {
        return figurePrefix + "-" + options.label + "-" + std::to_string(n) + "." + options.dev;
    };
    return ::runChunk(host, raw, code);
}

std::string Session::toOutput(std::string path) {
    std::string out = input.arcTransmuted(path);
    if (endsWith(out, ".lmd")) {
        out = out.substr(0, out.size() - 4) + ".md";
    }
    return out;
}

MapView Session::open(std::string path) {
    return input.open(path);
}

FileWriteOutput Session::create(std::string path) {
    return output.create(path);
}
