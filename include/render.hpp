// Rendering one input file, either as part of a project build or on its own.
#pragma once
#include <string>
#include <session.hpp>


bool renderFile(std::string in, Session* session); // .lmd files are woven into .md, anything else is copied through

bool runStandalone(std::string file, Session* session); // -i: the whole file is one chunk, printed to stdout
