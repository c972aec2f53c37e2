// LuaParser finds top-level statement boundaries. Lua won't hand us an AST, so we ask the compiler instead: a statement starting on
// line s ends on the first line e where both s..e and everything after e compile on their own.
#include <lua/luaengine.hpp>
#include <util.hpp>


struct LineInfo {
    bool code = false; // starts outside any long string/comment and has a code token on it
    bool annotation = false; // a LuaCATS annotation (---@...), which decorates the statement below it
};


static int longBracket(const std::string& s, size_t i) { // level of the [=*[ opener at s[i], or -1 if there isn't one
    size_t j = i + 1;
    int level = 0;
    while (j < s.size() && s[j] == '=') {
        level ++;
        j ++;
    }
    if (j < s.size() && s[j] == '[') {
        return level;
    }
    return -1;
}

static bool closesLong(const std::string& s, size_t& i, int level) { // s[i] == ']'. on success i is just past the closer.
    size_t j = i + 1;
    int count = 0;
    while (j < s.size() && s[j] == '=') {
        count ++;
        j ++;
    }
    if (count == level && j < s.size() && s[j] == ']') {
        i = j + 1;
        return true;
    }
    return false;
}

static std::vector<LineInfo> scanLines(const std::vector<std::string>& lines) {
    enum {
        Normal,
        LongString,
        LongComment,
        ShortString
    } state = Normal;
    int level = 0;
    char quote = 0;
    std::vector<LineInfo> infos;
    for (const std::string& line : lines) {
        LineInfo info;
        bool startsNormal = state == Normal;
        bool code = false;
        bool escapedNewline = false;
        if (startsNormal) {
            info.annotation = trim(line).compare(0, 4, "---@") == 0;
        }
        size_t i = 0;
        while (i < line.size()) {
            char c = line[i];
            if (state == Normal) {
                if (isWhitespace(c)) {
                    i ++;
                }
                else if (c == '-' && i + 1 < line.size() && line[i + 1] == '-') {
                    int l = i + 2 < line.size() && line[i + 2] == '[' ? longBracket(line, i + 2) : -1;
                    if (l < 0) {
                        break; // line comment
                    }
                    state = LongComment;
                    level = l;
                    i += 4 + l;
                }
                else if (c == '[' && longBracket(line, i) >= 0) {
                    code = true;
                    level = longBracket(line, i);
                    state = LongString;
                    i += 2 + level;
                }
                else if (c == '"' || c == '\'') {
                    code = true;
                    quote = c;
                    state = ShortString;
                    i ++;
                }
                else {
                    code = true;
                    i ++;
                }
            }
            else if (state == ShortString) {
                if (c == '\\') {
                    escapedNewline = i + 1 == line.size();
                    i += 2;
                }
                else {
                    if (c == quote) {
                        state = Normal;
                    }
                    i ++;
                }
            }
            else if (c == ']' && closesLong(line, i, level)) {
                state = Normal;
            }
            else {
                i ++;
            }
        }
        if (state == ShortString && !escapedNewline) { // unfinished string; the compiler has already complained about it
            state = Normal;
        }
        info.code = startsNormal && code;
        infos.push_back(info);
    }
    return infos;
}

static std::string joinLines(const std::vector<std::string>& lines, int from, int to) { // 0-based, inclusive
    std::string ret;
    for (int i = from; i <= to; i ++) {
        ret += lines[i];
        if (i != to) {
            ret += '\n';
        }
    }
    return ret;
}


LuaParser::LuaParser(lua_State* L) : lua(L) {}

bool LuaParser::compiles(const std::string& code, std::string* error) {
    int status = luaL_loadbuffer(lua, code.c_str(), code.size(), "=lua");
    if (status != 0 && error != NULL) {
        *error = lua_tostring(lua, -1);
    }
    lua_pop(lua, 1); // the compiled function, or the message
    return status == 0;
}

bool LuaParser::parse(const std::string& source, std::vector<TopLevelNode>& nodes, std::string& error) {
    nodes.clear();
    if (!compiles(source, &error)) {
        return false;
    }
    std::vector<std::string> lines = splitLines(source);
    std::vector<LineInfo> infos = scanLines(lines);
    int n = lines.size();
    int previousEnd = -1;
    int s = 0;
    while (s < n) {
        if (!infos[s].code) {
            s ++;
            continue;
        }
        int e = s;
        while (e < n - 1) {
            if (compiles(joinLines(lines, s, e)) && compiles(joinLines(lines, e + 1, n - 1))) {
                break;
            }
            e ++;
        }
        TopLevelNode node;
        node.line = s + 1;
        int k = s - 1;
        while (k > previousEnd && infos[k].annotation) {
            k --;
        }
        if (k + 1 < s) {
            node.hasDecoration = true;
            node.decorationLine = k + 2;
        }
        nodes.push_back(node);
        previousEnd = e;
        s = e + 1;
    }
    return true;
}


struct Token {
    size_t start;
    size_t end;
    bool name; // identifier or keyword; everything else is a symbol, string or number we only need to step over
};

static bool isNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

static size_t skipLong(const std::string& s, size_t i, int level) { // i is just past the opener. returns just past the closer, or the end.
    std::string closer = "]" + std::string(level, '=') + "]";
    size_t at = s.find(closer, i);
    return at == std::string::npos ? s.size() : at + closer.size();
}

static std::vector<Token> tokenize(const std::string& s) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        size_t start = i;
        if (isWhitespace(c)) {
            i ++;
            continue;
        }
        if (c == '-' && i + 1 < s.size() && s[i + 1] == '-') {
            int level = i + 2 < s.size() && s[i + 2] == '[' ? longBracket(s, i + 2) : -1;
            if (level >= 0) {
                i = skipLong(s, i + 4 + level, level);
            }
            else {
                size_t nl = s.find('\n', i);
                i = nl == std::string::npos ? s.size() : nl + 1;
            }
            continue;
        }
        if (c == '[' && longBracket(s, i) >= 0) {
            int level = longBracket(s, i);
            i = skipLong(s, i + 2 + level, level);
        }
        else if (c == '"' || c == '\'') {
            i ++;
            while (i < s.size() && s[i] != c) {
                i += s[i] == '\\' ? 2 : 1;
            }
            i ++;
        }
        else if (isNameChar(c)) {
            while (i < s.size() && isNameChar(s[i])) {
                i ++;
            }
            tokens.push_back(Token{ start, i, true });
            continue;
        }
        else if ((c == '=' || c == '~' || c == '<' || c == '>') && i + 1 < s.size() && s[i + 1] == '=') {
            i += 2;
        }
        else {
            i ++;
        }
        if (i > s.size()) {
            i = s.size();
        }
        tokens.push_back(Token{ start, i, false });
    }
    return tokens;
}

std::string promoteLocals(const std::string& code) {
    std::vector<Token> tokens = tokenize(code);
    auto text = [&](size_t k) {
        return code.substr(tokens[k].start, tokens[k].end - tokens[k].start);
    };
    struct Edit {
        size_t at;
        size_t erase;
        const char* insert;
    };
    std::vector<Edit> edits;
    int depth = 0; // blocks opened by function/if/do/repeat, closed by end/until. then/else/while/for open nothing of their own.
    for (size_t k = 0; k < tokens.size(); k ++) {
        if (!tokens[k].name) {
            continue;
        }
        std::string word = text(k);
        if (word == "function" || word == "if" || word == "do" || word == "repeat") {
            depth ++;
        }
        else if (word == "end" || word == "until") {
            depth --;
        }
        else if (word == "local" && depth == 0) {
            edits.push_back(Edit{ tokens[k].start, 5, "" }); // `local function f` becomes `function f`, `local a, b = 1` becomes `a, b = 1`
            size_t j = k + 1;
            if (j >= tokens.size() || text(j) == "function") {
                continue;
            }
            while (j + 2 < tokens.size() && text(j + 1) == "," && tokens[j + 2].name) {
                j += 2;
            }
            if (j + 1 >= tokens.size() || text(j + 1) != "=") { // a bare declaration still has to clear out whatever was there
                edits.push_back(Edit{ tokens[j].end, 0, " = nil" });
            }
        }
    }
    std::string ret = code;
    for (size_t e = edits.size(); e > 0; e --) {
        ret.replace(edits[e - 1].at, edits[e - 1].erase, edits[e - 1].insert);
    }
    return ret;
}
