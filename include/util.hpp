#pragma once
#include <string>
#include <vector>
#include <defs.h>


bool mkdirR(std::string filename); // create every directory leading up to a file. returns false if one of them couldn't be made.

std::string fconcat(std::string one, std::string two); // glue two path pieces together with exactly one / between them

std::string trim2dir(std::string file); // strip off a filename from a path
// if the path ends in /, it will not be changed
// the output will always be formatted for quick appending: if it is not fully stripped to an empty string, the last character will be a /

std::string leafName(std::string path); // the last component of a path ("/usr/bin/luajit" -> "luajit")

std::string stem(std::string path); // leafName without the extension

bool endsWith(const std::string& thing, const std::string& end);

bool isWhitespace(char thing);

bool isNumber(const std::string& data); // plain decimal, optional sign and fraction. no exponents, no hex.

bool toNumber(const std::string& data, double& out); // isNumber, and it fits in a double

std::string trim(std::string thing); // whitespace off both ends

std::vector<std::string> splitLines(const std::string& text); // a trailing newline doesn't make an extra empty line
