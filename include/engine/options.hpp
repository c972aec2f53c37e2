// Chunk options: the raw bag the document header gives us, and the validated struct the engine runs on.
#pragma once
#include <string>
#include <vector>
#include <utility>


struct OptionValue {
    enum Kind {
        Bool,
        Number,
        String
    } kind = String;
    bool boolean = false;
    double number = 0;
    std::string string;

    static OptionValue fromBool(bool b);

    static OptionValue fromNumber(double n);

    static OptionValue fromString(std::string s);
};


typedef std::vector<std::pair<std::string, OptionValue>> RawOptions; // in header order. "label" holds the chunk label, if any.


struct ChunkOptions { // immutable for the duration of a chunk
    std::string label;
    std::vector<std::string> code;

    bool eval = true;
    bool echo = true;
    bool include = true;
    bool warning = true; // attach diagnostics to the rendered chunk

    enum Results {
        Sequential, // interleave source and output
        Hold        // one echo of the whole source, then everything it produced
    } results = Sequential;

    enum ErrorMode {
        Capture, // failures become ErrorOutput items
        Abort    // failures stop the chunk
    } error = Abort;

    double figWidth = 7; // inches
    double figHeight = 5;
    int dpi = 72;
    std::string enginePath; // empty: whatever interpreter is loaded
    std::string dev = "svg";
};


// DisplayPolicy. Never fails; anything it doesn't like becomes a warning and a coerced value.
ChunkOptions validateOptions(const RawOptions& raw, std::vector<std::string>& warnings);
