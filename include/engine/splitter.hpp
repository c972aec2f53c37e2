// StatementSplitter: chops a chunk into the smallest pieces that can be run one at a time, so output can be interleaved with the source
// that produced it.
#pragma once
#include <string>
#include <vector>
#include <engine/interpreter.hpp>


struct SourceUnit {
    int startLine; // 1-based, inclusive
    int endLine;
    std::string text;
};


std::string extractLines(const std::vector<std::string>& code, int from, int to); // lines [from, to], 1-based, joined with \n

// units cover [1, code.size()] with no gaps or overlaps. an empty chunk gives no units.
// returns false (and fills error) if the parser rejects the source.
bool splitStatements(const std::vector<std::string>& code, Parser& parser, std::vector<SourceUnit>& units, std::string& error);
