#include <gtest/gtest.h>
#include <lua/luaengine.hpp>
#include <session.hpp>
#include <util.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>


struct CountingSink : GraphicsSink {
    int shows = 0;

    void show() {
        shows ++;
    }
};


static std::vector<TopLevelNode> parsed(LuaInterpreter& interpreter, std::string source) {
    LuaParser parser(interpreter.lua);
    std::vector<TopLevelNode> nodes;
    std::string error;
    EXPECT_TRUE(parser.parse(source, nodes, error)) << error;
    return nodes;
}

static std::vector<int> lines(const std::vector<TopLevelNode>& nodes) {
    std::vector<int> ret;
    for (const TopLevelNode& node : nodes) {
        ret.push_back(node.line);
    }
    return ret;
}


TEST(LuaParserTest, StatementsOnOneLineAreOneNode) {
    LuaInterpreter interpreter;
    EXPECT_EQ(lines(parsed(interpreter, "x = 1; y = 2")), std::vector<int>({ 1 }));
    EXPECT_EQ(lines(parsed(interpreter, "x = 1; y = 2\nprint(x + y)")), std::vector<int>({ 1, 2 }));
}

TEST(LuaParserTest, MultiLineStatements) {
    LuaInterpreter interpreter;
    std::string source = "local function f()\n  return 1\nend\nprint(f())";
    EXPECT_EQ(lines(parsed(interpreter, source)), std::vector<int>({ 1, 4 }));
    source = "t = {\n  1,\n  2,\n}\nprint(#t)";
    EXPECT_EQ(lines(parsed(interpreter, source)), std::vector<int>({ 1, 5 }));
}

TEST(LuaParserTest, CommentsAndStringsDontStartStatements) {
    LuaInterpreter interpreter;
    std::string source = "-- leading comment\ns = [[\nnot = code\n]]\n--[[ a\nlong comment ]]\nprint(s)";
    EXPECT_EQ(lines(parsed(interpreter, source)), std::vector<int>({ 2, 7 }));
}

TEST(LuaParserTest, AnnotationsDecorateTheNextStatement) {
    LuaInterpreter interpreter;
    std::vector<TopLevelNode> nodes = parsed(interpreter, "a = 1\n---@param x number\n---@return number\nfunction g(x) return x end");
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_FALSE(nodes[0].hasDecoration);
    EXPECT_EQ(nodes[1].line, 4);
    EXPECT_TRUE(nodes[1].hasDecoration);
    EXPECT_EQ(nodes[1].decorationLine, 2);
}

TEST(LuaParserTest, SyntaxErrorsAreReported) {
    LuaInterpreter interpreter;
    LuaParser parser(interpreter.lua);
    std::vector<TopLevelNode> nodes;
    std::string error;
    EXPECT_FALSE(parser.parse("x = = 1", nodes, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(lua_gettop(interpreter.lua), 0);
}


TEST(LuaInterpreterTest, PrintIsCapturedPerUnit) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("print('hello', 42)", EvalMode::Single);
    EXPECT_FALSE(result.raised);
    EXPECT_EQ(result.text, "hello\t42\n");
    result = interpreter.evalUnit("io.write('a', 'b')", EvalMode::Exec);
    EXPECT_EQ(result.text, "ab");
    result = interpreter.evalUnit("x = 1", EvalMode::Single);
    EXPECT_EQ(result.text, "");
}

TEST(LuaInterpreterTest, StdoutFileIsCaptured) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("io.stdout:write('a', 1):write('b\\n')", EvalMode::Exec);
    EXPECT_FALSE(result.raised) << result.message;
    EXPECT_EQ(result.text, "a1b\n");
    result = interpreter.evalUnit("io.output():write('c'); io.output():flush(); io.write('d')", EvalMode::Exec);
    EXPECT_FALSE(result.raised) << result.message;
    EXPECT_EQ(result.text, "cd");
    result = interpreter.evalUnit("print(io.output(io.stdout) == io.stdout, (io.stdout:close()))", EvalMode::Exec);
    EXPECT_EQ(result.text, "true\tnil\n");
}

TEST(LuaInterpreterTest, ExpressionsAreShownInSingleMode) {
    LuaInterpreter interpreter;
    ValueHandle before = interpreter.lastValue();
    EvalResult result = interpreter.evalUnit("1 + 1", EvalMode::Single);
    EXPECT_EQ(result.text, "2\n");
    EXPECT_NE(interpreter.lastValue(), before);
}

TEST(LuaInterpreterTest, EveryExpressionGetsAFreshHandle) {
    LuaInterpreter interpreter;
    interpreter.evalUnit("x = 5", EvalMode::Single);
    interpreter.evalUnit("x", EvalMode::Single);
    ValueHandle first = interpreter.lastValue();
    interpreter.evalUnit("x", EvalMode::Single);
    EXPECT_FALSE(sameHandle(first, interpreter.lastValue()));
    ValueHandle second = interpreter.lastValue();
    interpreter.evalUnit("y = x;", EvalMode::Exec);
    interpreter.evalUnit("print(x)", EvalMode::Single); // returns nothing
    EXPECT_TRUE(sameHandle(second, interpreter.lastValue()));
}

TEST(LuaInterpreterTest, TopLevelLocalsPersist) {
    LuaInterpreter interpreter;
    interpreter.evalUnit("g = 3", EvalMode::Single);
    interpreter.evalUnit("local l = 4", EvalMode::Single);
    EXPECT_EQ(interpreter.evalUnit("print(g, l)", EvalMode::Single).text, "3\t4\n");
    interpreter.evalUnit("local t = { 1, 2, 3 }", EvalMode::Single);
    EvalResult result = interpreter.evalUnit("print(#t)", EvalMode::Single);
    EXPECT_FALSE(result.raised) << result.message;
    EXPECT_EQ(result.text, "3\n");
    interpreter.evalUnit("local function sq(x) return x * x end", EvalMode::Single);
    EXPECT_EQ(interpreter.evalUnit("print(sq(4))", EvalMode::Single).text, "16\n");
    interpreter.evalUnit("local l", EvalMode::Single); // a bare declaration clears the old value
    EXPECT_EQ(interpreter.evalUnit("print(l)", EvalMode::Single).text, "nil\n");
}

TEST(LuaInterpreterTest, NestedLocalsStayLocal) {
    LuaInterpreter interpreter;
    interpreter.evalUnit("function f() local inner = 1 return inner end", EvalMode::Single);
    interpreter.evalUnit("do local block = 2 end", EvalMode::Single);
    interpreter.evalUnit("if true then local branch = 3 end", EvalMode::Single);
    EXPECT_EQ(interpreter.evalUnit("print(f(), inner, block, branch)", EvalMode::Single).text, "1\tnil\tnil\tnil\n");
}

TEST(PromoteLocalsTest, RewritesOnlyTopLevelDeclarations) {
    EXPECT_EQ(promoteLocals("local a, b = 1, 2"), " a, b = 1, 2");
    EXPECT_EQ(promoteLocals("local a, b"), " a, b = nil");
    EXPECT_EQ(promoteLocals("local function f() local x = 1 end"), " function f() local x = 1 end");
    EXPECT_EQ(promoteLocals("x = 1; local y = 2"), "x = 1;  y = 2");
    EXPECT_EQ(promoteLocals("s = 'local q' -- local r\nt = [[local u]]"), "s = 'local q' -- local r\nt = [[local u]]");
    EXPECT_EQ(promoteLocals("for i = 1, 2 do local v = i end"), "for i = 1, 2 do local v = i end");
    EXPECT_EQ(promoteLocals("repeat local w = 1 until w == 1"), "repeat local w = 1 until w == 1");
}

TEST(LuaInterpreterTest, ErrorsAreCaught) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("print('before'); error('boom')", EvalMode::Single);
    EXPECT_TRUE(result.raised);
    EXPECT_NE(result.message.find("boom"), std::string::npos);
    EXPECT_EQ(result.text, "before\n");
    result = interpreter.evalUnit("error({})", EvalMode::Single);
    EXPECT_TRUE(result.raised);
    EXPECT_NE(result.message.find("table"), std::string::npos);
    EXPECT_EQ(lua_gettop(interpreter.lua), 0);
}

TEST(LuaInterpreterTest, FailingToStringIsAnError) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("setmetatable({}, { __tostring = function() error('no string for you') end })", EvalMode::Single);
    EXPECT_TRUE(result.raised);
    EXPECT_NE(result.message.find("no string for you"), std::string::npos);
}

TEST(LuaInterpreterTest, ArtistsAreGraphics) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("plot.line({ 1, 4, 9 })", EvalMode::Single);
    EXPECT_FALSE(result.raised) << result.message;
    EXPECT_EQ(result.text, "<plot.line #1>\n");
    EXPECT_TRUE(interpreter.lastValueIsGraphic());
    interpreter.evalUnit("p = plot.points({ 1, 2 }, { 3, 4 }, 'pts')", EvalMode::Single);
    interpreter.evalUnit("{ p }", EvalMode::Single);
    EXPECT_TRUE(interpreter.lastValueIsGraphic());
    interpreter.evalUnit("{ p, p }", EvalMode::Single);
    EXPECT_FALSE(interpreter.lastValueIsGraphic());
    interpreter.evalUnit("42", EvalMode::Single);
    EXPECT_FALSE(interpreter.lastValueIsGraphic());
    EXPECT_EQ(interpreter.surface.series.size(), 2u);
}

TEST(LuaInterpreterTest, BadPlotDataRaises) {
    LuaInterpreter interpreter;
    EvalResult result = interpreter.evalUnit("plot.line({ 1, 2 }, { 1 })", EvalMode::Single);
    EXPECT_TRUE(result.raised);
    result = interpreter.evalUnit("plot.bars({ 'a' })", EvalMode::Single);
    EXPECT_TRUE(result.raised);
    EXPECT_TRUE(interpreter.surface.series.empty());
}

TEST(LuaInterpreterTest, ShowGoesToTheSink) {
    LuaInterpreter interpreter;
    CountingSink sink;
    EXPECT_FALSE(interpreter.evalUnit("plot.show()", EvalMode::Single).raised); // no sink: nothing happens
    interpreter.setGraphicsSink(&sink);
    EvalResult result = interpreter.evalUnit("plot.show()", EvalMode::Single);
    EXPECT_EQ(sink.shows, 1);
    EXPECT_EQ(result.text, "");
    interpreter.setGraphicsSink(NULL);
}

TEST(LuaInterpreterTest, HostValuesAreBound) {
    LuaInterpreter interpreter;
    interpreter.bindHostValues({ HostBinding{ "n", "3" }, HostBinding{ "who", "world" } });
    EXPECT_EQ(interpreter.evalUnit("print(host.n + 1, host.who)", EvalMode::Single).text, "4\tworld\n");
    EXPECT_EQ(interpreter.name(), "luajit");
    std::string huge(400, '9');
    interpreter.bindHostValues({ HostBinding{ "big", huge } });
    EXPECT_EQ(interpreter.evalUnit("print(type(host.big))", EvalMode::Single).text, "string\n");
}


TEST(SvgBackendTest, RendersTheSurface) {
    PlotSurface surface;
    SvgBackend backend(surface);
    surface.title = "a < b";
    surface.series.push_back(PlotSeries{ PlotSeries::Line, { 1, 2, 3 }, { 1, 4, 9 }, "squares" });
    std::string svg = backend.toSvg(FigureSize{ 4, 3, 100 });
    EXPECT_EQ(svg.compare(0, 4, "<svg"), 0);
    EXPECT_NE(svg.find("width=\"400.00\""), std::string::npos);
    EXPECT_NE(svg.find("<polyline"), std::string::npos);
    EXPECT_NE(svg.find("a &lt; b"), std::string::npos);
    EXPECT_NE(svg.find("squares"), std::string::npos);
    backend.clearSurface();
    EXPECT_TRUE(surface.empty());
}


class LuaSessionTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        char name[] = "/tmp/luaweave-test-XXXXXX";
        ASSERT_NE(mkdtemp(name), nullptr);
        dir = name;
    }

    void TearDown() override {
        std::string command = "rm -rf '" + dir + "'";
        EXPECT_EQ(system(command.c_str()), 0);
    }

    static std::string slurp(std::string path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(LuaSessionTest, ChunkOutputInterleavesWithSource) {
    Session session(dir, fconcat(dir, "out"));
    ChunkResult result = session.runChunk({ { "label", OptionValue::fromString("sums") } }, { "x = 10", "y = 20", "print(x + y)" }, fconcat(dir, "out/figure/doc"));
    ASSERT_FALSE(result.fatal) << result.error;
    std::vector<OutputItem> expected = {
        OutputItem{ OutputItem::SourceEcho, "x = 10\ny = 20\nprint(x + y)" },
        OutputItem{ OutputItem::TextOutput, "30\n" }
    };
    EXPECT_EQ(result.items, expected);
}

TEST_F(LuaSessionTest, ShowWritesAnSvg) {
    Session session(dir, fconcat(dir, "out"));
    std::string prefix = fconcat(dir, "out/figure/doc");
    ChunkResult result = session.runChunk({ { "label", OptionValue::fromString("curve") } }, { "plot.line({ 1, 4, 9 })", "plot.show()" }, prefix);
    ASSERT_FALSE(result.fatal) << result.error;
    std::string path = prefix + "-curve-1.svg";
    std::vector<OutputItem> expected = {
        OutputItem{ OutputItem::SourceEcho, "plot.line({ 1, 4, 9 })\nplot.show()" },
        OutputItem{ OutputItem::GraphicArtifact, path }
    };
    EXPECT_EQ(result.items, expected);
    EXPECT_EQ(slurp(path).compare(0, 4, "<svg"), 0);
    EXPECT_TRUE(session.interpreter.surface.empty());
    EXPECT_EQ(session.interpreter.graphicsSink(), nullptr);
}

TEST_F(LuaSessionTest, FinalArtistIsShown) {
    Session session(dir, fconcat(dir, "out"));
    std::string prefix = fconcat(dir, "out/figure/doc");
    ChunkResult result = session.runChunk({ { "label", OptionValue::fromString("pts") } }, { "plot.points({ 1, 2 }, { 3, 4 })" }, prefix);
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[1], (OutputItem{ OutputItem::GraphicArtifact, prefix + "-pts-1.svg" }));
}

TEST_F(LuaSessionTest, LuaErrorFailsTheChunkInADocument) {
    Session session(dir, fconcat(dir, "out"));
    ChunkResult result = session.runChunk({ { "label", OptionValue::fromString("bad") } }, { "error('nope')", "print('unreached')" }, fconcat(dir, "out/figure/doc"));
    EXPECT_TRUE(result.fatal);
    EXPECT_NE(result.error.find("nope"), std::string::npos);
}

TEST_F(LuaSessionTest, StandaloneRunsCaptureErrors) {
    Session session(dir, fconcat(dir, "out"));
    session.inDocumentBuild = false;
    ChunkResult result = session.runChunk({ { "label", OptionValue::fromString("bad") } }, { "error('nope')", "print('unreached')" }, fconcat(dir, "out/figure/doc"));
    ASSERT_FALSE(result.fatal);
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[1].kind, OutputItem::ErrorOutput);
}

TEST_F(LuaSessionTest, LocalsCarryAcrossUnitsAndChunks) {
    Session session(dir, fconcat(dir, "out"));
    ChunkResult result = session.runChunk({}, { "local t = { 1, 2, 3 }", "print(#t)" }, fconcat(dir, "out/figure/doc"));
    ASSERT_FALSE(result.fatal) << result.error;
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[1].content, "3\n");
    result = session.runChunk({}, { "print(t[3])" }, fconcat(dir, "out/figure/doc"));
    ASSERT_FALSE(result.fatal) << result.error;
    EXPECT_EQ(result.items[1].content, "3\n");
}

TEST_F(LuaSessionTest, SyntaxErrorIsFatal) {
    Session session(dir, fconcat(dir, "out"));
    ChunkResult result = session.runChunk({}, { "x = = 1" }, fconcat(dir, "out/figure/doc"));
    EXPECT_TRUE(result.fatal);
    EXPECT_FALSE(result.error.empty());
}

TEST_F(LuaSessionTest, ConfigEntriesReachTheGuest) {
    Session session(dir, fconcat(dir, "out"));
    session.config.push_back(ConfigEntry{ "title", "Report" });
    ChunkResult result = session.runChunk({}, { "print(host.title)" }, fconcat(dir, "out/figure/doc"));
    ASSERT_EQ(result.items.size(), 2u);
    EXPECT_EQ(result.items[1].content, "Report\n");
}
