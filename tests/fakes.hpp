// Stand-ins for the guest language, so the engine can be tested without LuaJIT.
//
// FakeParser: one statement per ';'-separated piece of a line. "--" starts a comment, "@..." lines decorate the next statement and
// "!!" anywhere is a syntax error.
// FakeInterpreter understands just enough to be useful: name=expr, print(expr), error(message), show(), fig() (a graphic value) and
// bare expressions, where an expression is a sum of integers and variable names.
#pragma once
#include <map>
#include <string>
#include <vector>
#include <engine/interpreter.hpp>
#include <util.hpp>


static std::vector<std::string> statementsOf(const std::string& line) {
    std::string code = line.substr(0, line.find("--"));
    std::vector<std::string> ret;
    size_t start = 0;
    while (start <= code.size()) {
        size_t semi = code.find(';', start);
        std::string piece = trim(code.substr(start, semi == std::string::npos ? std::string::npos : semi - start));
        if (piece.size() > 0) {
            ret.push_back(piece);
        }
        if (semi == std::string::npos) {
            break;
        }
        start = semi + 1;
    }
    return ret;
}


struct FakeParser : Parser {
    int calls = 0;

    bool parse(const std::string& source, std::vector<TopLevelNode>& nodes, std::string& error) {
        calls ++;
        nodes.clear();
        if (source.find("!!") != std::string::npos) {
            error = "syntax error near '!!'";
            return false;
        }
        std::vector<std::string> lines = splitLines(source);
        int decoration = 0;
        for (size_t i = 0; i < lines.size(); i ++) {
            int line = i + 1;
            if (trim(lines[i]).compare(0, 1, "@") == 0) {
                if (decoration == 0) {
                    decoration = line;
                }
                continue;
            }
            for (size_t j = 0; j < statementsOf(lines[i]).size(); j ++) {
                TopLevelNode node;
                node.line = line;
                if (decoration != 0) {
                    node.hasDecoration = true;
                    node.decorationLine = decoration;
                    decoration = 0;
                }
                nodes.push_back(node);
            }
        }
        return true;
    }
};


struct FakeInterpreter : Interpreter {
    std::map<std::string, int> vars;
    std::vector<std::string> executed; // unit texts, in the order they ran
    std::vector<HostBinding> bound;
    ValueHandle generation = 0;
    bool graphic = false;
    GraphicsSink* sink = NULL;

    int value(const std::string& expr) {
        int sum = 0;
        size_t start = 0;
        while (start <= expr.size()) {
            size_t plus = expr.find('+', start);
            std::string term = trim(expr.substr(start, plus == std::string::npos ? std::string::npos : plus - start));
            sum += isNumber(term) ? std::stoi(term) : vars[term];
            if (plus == std::string::npos) {
                break;
            }
            start = plus + 1;
        }
        return sum;
    }

    static std::string inner(const std::string& call) { // print(x) -> x
        size_t open = call.find('(');
        return call.substr(open + 1, call.size() - open - 2);
    }

    EvalResult evalUnit(const std::string& text, EvalMode mode) {
        executed.push_back(text);
        EvalResult result;
        std::vector<std::string> statements;
        for (const std::string& line : splitLines(text)) {
            if (trim(line).compare(0, 1, "@") == 0) {
                continue;
            }
            for (const std::string& s : statementsOf(line)) {
                statements.push_back(s);
            }
        }
        for (size_t i = 0; i < statements.size(); i ++) {
            const std::string& s = statements[i];
            bool shown = mode == EvalMode::Single && i == statements.size() - 1;
            if (s.compare(0, 6, "error(") == 0) {
                result.raised = true;
                result.message = inner(s);
                return result;
            }
            else if (s == "show()") {
                if (sink != NULL) {
                    sink -> show();
                }
            }
            else if (s.compare(0, 6, "print(") == 0) {
                result.text += std::to_string(value(inner(s))) + "\n";
            }
            else if (s == "fig()") {
                if (shown) {
                    generation ++;
                    graphic = true;
                    result.text += "<figure>\n";
                }
            }
            else if (s.find('=') != std::string::npos) {
                vars[trim(s.substr(0, s.find('=')))] = value(s.substr(s.find('=') + 1));
            }
            else if (shown) {
                generation ++;
                graphic = false;
                result.text += std::to_string(value(s)) + "\n";
            }
        }
        return result;
    }

    ValueHandle lastValue() {
        return generation;
    }

    bool lastValueIsGraphic() {
        return graphic;
    }

    GraphicsSink* graphicsSink() {
        return sink;
    }

    void setGraphicsSink(GraphicsSink* s) {
        sink = s;
    }

    void bindHostValues(const std::vector<HostBinding>& bindings) {
        bound = bindings;
        for (const HostBinding& binding : bindings) {
            if (isNumber(binding.value)) {
                vars[binding.name] = std::stoi(binding.value);
            }
        }
    }

    std::string name() {
        return "fake";
    }
};


struct FakeBackend : GraphicsBackend {
    std::vector<std::string> rendered; // paths, in order
    std::vector<FigureSize> sizes;
    int clears = 0;
    bool fail = false;

    std::string render(const std::string& path, FigureSize size) {
        if (fail) {
            return "";
        }
        rendered.push_back(path);
        sizes.push_back(size);
        return path;
    }

    void clearSurface() {
        clears ++;
    }
};


struct CountingSink : GraphicsSink {
    int shows = 0;

    void show() {
        shows ++;
    }
};
