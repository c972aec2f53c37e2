#include <engine/splitter.hpp>


std::string extractLines(const std::vector<std::string>& code, int from, int to) {
    std::string ret;
    for (int i = from; i <= to; i ++) {
        ret += code[i - 1];
        if (i != to) {
            ret += '\n';
        }
    }
    return ret;
}

bool splitStatements(const std::vector<std::string>& code, Parser& parser, std::vector<SourceUnit>& units, std::string& error) {
    units.clear();
    int n = code.size();
    if (n == 0) {
        return true;
    }
    std::vector<TopLevelNode> nodes;
    if (!parser.parse(extractLines(code, 1, n), nodes, error)) {
        return false;
    }
    std::vector<int> starts;
    for (TopLevelNode& node : nodes) {
        int line = node.hasDecoration ? node.decorationLine : node.line;
        if (starts.size() > 0 && starts[starts.size() - 1] >= line) { // several statements on one line only split once
            continue;
        }
        starts.push_back(line);
    }
    if (starts.size() == 0) { // nothing but comments and blank lines; still one unit so the ranges stay exhaustive
        starts.push_back(1);
    }
    starts[0] = 1; // leading comments belong to the first statement
    for (size_t i = 0; i < starts.size(); i ++) {
        int end = i + 1 < starts.size() ? starts[i + 1] - 1 : n;
        units.push_back(SourceUnit{ starts[i], end, extractLines(code, starts[i], end) });
    }
    return true;
}
