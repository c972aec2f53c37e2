#include <chunkheader.hpp>
#include <util.hpp>
#include <vector>


bool isLuaChunkHeader(const std::string& line) {
    std::string t = trim(line);
    if (t.compare(0, 7, "```{lua") != 0 || t[t.size() - 1] != '}') {
        return false;
    }
    char next = t[7];
    return next == '}' || next == ',' || isWhitespace(next); // not ```{luax}
}

OptionValue parseOptionValue(std::string text) {
    text = trim(text);
    if (text == "TRUE" || text == "true" || text == "T") {
        return OptionValue::fromBool(true);
    }
    if (text == "FALSE" || text == "false" || text == "F") {
        return OptionValue::fromBool(false);
    }
    double number;
    if (toNumber(text, number)) { // too big for a double stays a string, and validation complains about its kind
        return OptionValue::fromNumber(number);
    }
    if (text.size() >= 2 && (text[0] == '"' || text[0] == '\'') && text[text.size() - 1] == text[0]) {
        return OptionValue::fromString(text.substr(1, text.size() - 2));
    }
    return OptionValue::fromString(text);
}

static bool splitFields(const std::string& header, std::vector<std::string>& fields) { // on commas outside of quotes
    std::string field;
    char quote = 0;
    for (char c : header) {
        if (quote != 0) {
            if (c == quote) {
                quote = 0;
            }
        }
        else if (c == '"' || c == '\'') {
            quote = c;
        }
        else if (c == ',') {
            fields.push_back(trim(field));
            field.clear();
            continue;
        }
        field += c;
    }
    fields.push_back(trim(field));
    return quote == 0;
}

bool parseChunkHeader(std::string header, RawOptions& options, std::string& error) {
    std::vector<std::string> fields;
    if (!splitFields(header, fields)) {
        error = "unterminated string in chunk header";
        return false;
    }
    std::string engine = fields[0]; // "lua" or "lua label"
    size_t space = engine.find_first_of(" \t");
    bool hasLabel = false;
    if (space != std::string::npos) {
        std::string label = trim(engine.substr(space));
        if (label.find('=') != std::string::npos) {
            error = "the first option must be the engine name, not '" + label + "'";
            return false;
        }
        options.push_back({ "label", OptionValue::fromString(label) });
        hasLabel = true;
    }
    for (size_t i = 1; i < fields.size(); i ++) {
        std::string& field = fields[i];
        if (field.size() == 0) {
            continue; // trailing comma
        }
        size_t eq = field.find('=');
        if (eq == std::string::npos) {
            if (i == 1 && !hasLabel) { // {lua, label, ...}
                options.push_back({ "label", parseOptionValue(field) });
                hasLabel = true;
                continue;
            }
            error = "chunk option '" + field + "' has no value";
            return false;
        }
        std::string name = trim(field.substr(0, eq));
        if (name.size() == 0) {
            error = "chunk option with no name";
            return false;
        }
        options.push_back({ name, parseOptionValue(field.substr(eq + 1)) });
    }
    return true;
}
