#include <engine/options.hpp>
#include <defs.h>
#include <cstdio>


OptionValue OptionValue::fromBool(bool b) {
    OptionValue v;
    v.kind = Bool;
    v.boolean = b;
    return v;
}

OptionValue OptionValue::fromNumber(double n) {
    OptionValue v;
    v.kind = Number;
    v.number = n;
    return v;
}

OptionValue OptionValue::fromString(std::string s) {
    OptionValue v;
    v.kind = String;
    v.string = s;
    return v;
}


static void warn(std::vector<std::string>& warnings, std::string message) {
    printf(WARNING "%s\n", message.c_str());
    warnings.push_back(message);
}

static void badKind(std::vector<std::string>& warnings, const std::string& name, const char* wanted) {
    warn(warnings, "chunk option '" + name + "' must be " + wanted + "; using the default");
}

static void setBool(bool& field, const std::string& name, const OptionValue& value, std::vector<std::string>& warnings) {
    if (value.kind == OptionValue::Bool) {
        field = value.boolean;
    }
    else {
        badKind(warnings, name, "TRUE or FALSE");
    }
}

static void setNumber(double& field, const std::string& name, const OptionValue& value, std::vector<std::string>& warnings) {
    if (value.kind == OptionValue::Number && value.number > 0) {
        field = value.number;
    }
    else {
        badKind(warnings, name, "a positive number");
    }
}

static void setString(std::string& field, const std::string& name, const OptionValue& value, std::vector<std::string>& warnings) {
    if (value.kind == OptionValue::String) {
        field = value.string;
    }
    else {
        badKind(warnings, name, "a string");
    }
}


ChunkOptions validateOptions(const RawOptions& raw, std::vector<std::string>& warnings) {
    ChunkOptions options;
    for (const auto& [name, given] : raw) {
        OptionValue value = given;
        if (name == "eval" || name == "echo" || name == "warning") { // these are strictly TRUE/FALSE, no "echo lines 2 through 4"
            if (value.kind == OptionValue::Number) {
                warn(warnings, "numeric '" + name + "' chunk option not supported by the lua engine");
                value = OptionValue::fromBool(true);
            }
            bool& field = name == "eval" ? options.eval : (name == "echo" ? options.echo : options.warning);
            setBool(field, name, value, warnings);
        }
        else if (name == "include") {
            setBool(options.include, name, value, warnings);
        }
        else if (name == "label") {
            setString(options.label, name, value, warnings);
        }
        else if (name == "results") {
            if (value.kind == OptionValue::String && value.string == "hold") {
                options.results = ChunkOptions::Hold;
            }
            else if (value.kind == OptionValue::String && (value.string == "markup" || value.string == "asis")) {
                options.results = ChunkOptions::Sequential;
            }
            else {
                badKind(warnings, name, "\"markup\", \"asis\" or \"hold\"");
            }
        }
        else if (name == "error") {
            if (value.kind == OptionValue::Bool) {
                options.error = value.boolean ? ChunkOptions::Capture : ChunkOptions::Abort;
            }
            else if (value.kind == OptionValue::String && value.string == "capture") {
                options.error = ChunkOptions::Capture;
            }
            else if (value.kind == OptionValue::String && value.string == "abort") {
                options.error = ChunkOptions::Abort;
            }
            else {
                badKind(warnings, name, "TRUE, FALSE, \"capture\" or \"abort\"");
            }
        }
        else if (name == "fig.width") {
            setNumber(options.figWidth, name, value, warnings);
        }
        else if (name == "fig.height") {
            setNumber(options.figHeight, name, value, warnings);
        }
        else if (name == "dpi") {
            double dpi = options.dpi;
            setNumber(dpi, name, value, warnings);
            options.dpi = (int)dpi;
        }
        else if (name == "engine.path") {
            setString(options.enginePath, name, value, warnings);
        }
        else if (name == "dev") {
            setString(options.dev, name, value, warnings);
        }
        else {
            warn(warnings, "unknown chunk option '" + name + "' ignored");
        }
    }
    return options;
}
