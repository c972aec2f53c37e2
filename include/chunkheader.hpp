// Chunk headers: the {lua label, echo=FALSE, fig.width=5} part of a chunk fence.
#pragma once
#include <string>
#include <engine/options.hpp>


bool isLuaChunkHeader(const std::string& line); // ```{lua ...}

OptionValue parseOptionValue(std::string text); // TRUE/FALSE, numbers, 'quoted' or "quoted" strings; anything else is a bare string

// parses everything between the braces. returns false (with error set) on a malformed header; options holds whatever parsed before that.
bool parseChunkHeader(std::string header, RawOptions& options, std::string& error);
