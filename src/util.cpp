#include <util.hpp>
#include <sys/stat.h>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <cmath>
// definitions for util functions


bool mkdirR(std::string filename) { // recursively create the directories before a file
    // expects syntax like directory/directory/directory/file or directory/directory/directory/. directory/directory/directory is not supported.
    struct stat sb;
    size_t blobend = 1; // skip a leading / so absolute paths don't try to create ""
    while (blobend < filename.size()) {
        if (filename[blobend] == '/') {
            std::string dirname = filename.substr(0, blobend);
            if (stat(dirname.c_str(), &sb) == -1) {
                if (mkdir(dirname.c_str(), 0755) != 0) {
                    printf(ERROR "Couldn't create %s!\n", dirname.c_str());
                    perror("\tmkdir");
                    return false;
                }
            }
            else if (!S_ISDIR(sb.st_mode)) {
                printf(ERROR "%s exists and is not a directory. Aborting recursive mkdir operation.\n", dirname.c_str());
                return false;
            }
        }
        blobend++;
    }
    return true;
}

std::string fconcat(std::string one, std::string two) { // sanely glue two filenames together (useful for things like "output-dir" + "test.md")
    if (one.size() == 0) {
        return two;
    }
    if (two.size() == 0) {
        return one;
    }
    if (one[one.size() - 1] == '/' && two[0] == '/') {
        return one.substr(0, one.size() - 1) + two;
    }
    else if (one[one.size() - 1] == '/' || two[0] == '/') {
        return one + two;
    }
    else {
        return one + '/' + two;
    }
}

std::string trim2dir(std::string file) {
    size_t slash = file.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return file.substr(0, slash + 1);
}

std::string leafName(std::string path) {
    while (path.size() > 1 && path[path.size() - 1] == '/') {
        path.pop_back();
    }
    return path.substr(trim2dir(path).size());
}

std::string stem(std::string path) {
    std::string leaf = leafName(path);
    size_t dot = leaf.rfind('.');
    if (dot == std::string::npos || dot == 0) {
        return leaf;
    }
    return leaf.substr(0, dot);
}

bool endsWith(const std::string& thing, const std::string& end) {
    return thing.size() >= end.size() && thing.compare(thing.size() - end.size(), end.size(), end) == 0;
}

bool isWhitespace(char thing) {
    return thing == ' ' || thing == '\t' || thing == '\n' || thing == '\r';
}

bool isNumber(const std::string& data) {
    size_t i = 0;
    if (i < data.size() && (data[i] == '-' || data[i] == '+')) {
        i ++;
    }
    bool digits = false;
    bool dot = false;
    for (; i < data.size(); i ++) {
        if (data[i] >= '0' && data[i] <= '9') {
            digits = true;
        }
        else if (data[i] == '.' && !dot) {
            dot = true;
        }
        else {
            return false;
        }
    }
    return digits;
}

bool toNumber(const std::string& data, double& out) {
    if (!isNumber(data)) {
        return false;
    }
    errno = 0;
    out = strtod(data.c_str(), NULL);
    return !(errno == ERANGE && std::isinf(out)); // underflow just rounds toward zero, overflow isn't a number we can use
}

std::string trim(std::string thing) {
    size_t start = 0;
    while (start < thing.size() && isWhitespace(thing[start])) {
        start ++;
    }
    size_t end = thing.size();
    while (end > start && isWhitespace(thing[end - 1])) {
        end --;
    }
    return thing.substr(start, end - start);
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}
