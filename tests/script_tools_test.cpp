/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "script/script_errors.h"
#include "script/script_tools.h"
#include "test_helpers.h"
#include "utils/fs_utils.h"
#include "utils/subprocess.h"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace romc::script {
namespace {
using test::bytes_of;

ProcessTools tools_with_command(std::vector<std::string> command) {
    ProcessToolsOptions opt{};
    opt.decompiler_command = std::move(command);
    return ProcessTools(std::move(opt));
}

TEST(SubprocessTest, CapturesStdoutAndExitCode) {
    const auto res = proc::run_process({"sh", "-c", "printf out; printf err >&2; exit 3"});
    ASSERT_TRUE(res.launched);
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.out, "out");
    EXPECT_EQ(res.err, "err");
}

TEST(SubprocessTest, MissingProgram) {
    const auto res = proc::run_process({"/nonexistent/romc-tool"});
    EXPECT_TRUE(!res.launched || res.exit_code == 127);
}

TEST(ProcessToolsTest, DecompileReturnsStdout) {
    auto tools = tools_with_command({"cat"});
    const auto chunk = bytes_of("\x1bLuaS chunk bytes");
    EXPECT_EQ(tools.decompile(chunk), "\x1bLuaS chunk bytes");
}

TEST(ProcessToolsTest, DecompileNonZeroExitIsToolFailure) {
    auto tools = tools_with_command({"sh", "-c", "echo 'bad chunk' >&2; exit 1", "sh"});
    try {
        tools.decompile(bytes_of("x"));
        FAIL() << "expected ToolFailure";
    } catch (const ToolFailure& ex) {
        EXPECT_NE(std::string(ex.what()).find("bad chunk"), std::string::npos);
    }
}

TEST(ProcessToolsTest, DecompileMissingProgramIsUnavailable) {
    auto tools = tools_with_command({"/nonexistent/unluac"});
    EXPECT_THROW(tools.decompile(bytes_of("x")), RuntimeUnavailable);
}

TEST(ProcessToolsTest, DecompileMissingJarIsUnavailable) {
    fs_utils::ScopedTempDir tmp;
    ProcessToolsOptions opt{};
    opt.decompiler_jar = tmp.path() / "unluac.jar";
    ProcessTools tools(opt);
    try {
        tools.decompile(bytes_of("x"));
        FAIL() << "expected RuntimeUnavailable";
    } catch (const RuntimeUnavailable& ex) {
        EXPECT_NE(std::string(ex.what()).find("unluac jar missing"), std::string::npos);
    }
}

TEST(ProcessToolsTest, JarArgvUsesJava) {
    fs_utils::ScopedTempDir tmp;
    const auto jar = tmp.path() / "unluac.jar";
    fs_utils::write_text_file(jar, "");
    ProcessToolsOptions opt{};
    opt.decompiler_jar = jar;
    opt.java_executable = "/usr/lib/jvm/bin/java";
    ProcessTools tools(opt);
    const auto argv = tools.decompiler_argv();
    ASSERT_EQ(argv.size(), 3u);
    EXPECT_EQ(argv[0], "/usr/lib/jvm/bin/java");
    EXPECT_EQ(argv[1], "-jar");
    EXPECT_EQ(argv[2], jar.string());
}

TEST(ProcessToolsTest, ResolvedPathsAreCachedUntilReset) {
    ProcessTools tools;
    EXPECT_EQ(tools.lua_path().string(), "lua5.3");
    tools.reset_resolved_paths();
    EXPECT_EQ(tools.lua_path().string(), "lua5.3");
}

TEST(ProcessToolsTest, DumpMissingInterpreterIsUnavailable) {
    fs_utils::ScopedTempDir tmp;
    ProcessToolsOptions opt{};
    opt.lua_executable = tmp.path() / "lua";
    ProcessTools tools(opt);
    EXPECT_THROW(tools.dump_table(bytes_of("t = {}"), "t"), RuntimeUnavailable);
}

TEST(TableDumpParseTest, EmptyOutputIsEmptyObject) {
    const auto v = parse_table_dump("  \n");
    EXPECT_TRUE(v.is_object());
    EXPECT_TRUE(v.empty());
}

TEST(TableDumpParseTest, KeepsKeyOrder) {
    EXPECT_EQ(parse_table_dump(R"({"2":1,"10":2,"a":[1,2]})").dump(), R"({"2":1,"10":2,"a":[1,2]})");
}

TEST(TableDumpParseTest, GarbageIsToolFailure) {
    EXPECT_THROW(parse_table_dump("lua: not json"), ToolFailure);
}

TEST(TableDumpParseTest, ScriptTakesChunkAndName) {
    const auto script = table_dump_script();
    EXPECT_NE(script.find("loadfile(chunk_path, \"bt\", env)"), std::string_view::npos);
    EXPECT_NE(script.find("os.exit(3)"), std::string_view::npos);
}

// Runs against the interpreter found at configure time, ROMC_TEST_LUA_EXE, or `lua5.3`.
std::string lua_interpreter() {
    const char* exe = std::getenv("ROMC_TEST_LUA_EXE");
    if (exe && *exe) {
        return exe;
    }
#ifdef ROMC_TEST_LUA_EXE_PATH
    return ROMC_TEST_LUA_EXE_PATH;
#else
    return "lua5.3";
#endif
}

class LuaInterpreterTest : public ::testing::Test {
   protected:
    void SetUp() override {
        _lua = lua_interpreter();
        const auto res = proc::run_process({_lua, "-v"});
        if (!res.launched || res.exit_code != 0) {
            GTEST_SKIP() << _lua << " not available";
        }
    }

    LuaValue dump(std::string_view source, std::string_view name) {
        ProcessToolsOptions opt{};
        opt.lua_executable = std::filesystem::path(_lua);
        ProcessTools tools(std::move(opt));
        return tools.dump_table(bytes_of(source), name);
    }

    std::string _lua;
};

TEST_F(LuaInterpreterTest, ArraysAndObjects) {
    const auto v = dump("t = {list = {1, 2, 3}, gap = {[1] = 'a', [3] = 'c'}, n = 1.5}", "t");
    EXPECT_EQ(v.dump(), R"({"gap":{"1":"a","3":"c"},"list":[1,2,3],"n":1.5})");
}

TEST_F(LuaInterpreterTest, CyclesAndNonFiniteBecomeNull) {
    const auto v = dump("t = {inf = math.huge, x = 2.0}; t.self = t", "t");
    EXPECT_TRUE(v["inf"].is_null());
    EXPECT_TRUE(v["self"].is_null());
    EXPECT_TRUE(v["x"].is_number_float());
}

TEST_F(LuaInterpreterTest, MixedKeyOrder) {
    const auto v = dump("t = {b = 1, [10] = 2, a = 3, [2] = 4, [true] = 5}", "t");
    EXPECT_EQ(v.dump(), R"({"2":4,"10":2,"a":3,"b":1,"true":5})");
}

TEST_F(LuaInterpreterTest, EscapesControlCharacters) {
    const auto v = dump("t = {s = 'a\\n\\1\"'}", "t");
    EXPECT_EQ(v["s"], std::string("a\n\x01\""));
}

TEST_F(LuaInterpreterTest, MissingTableIsFault) {
    EXPECT_THROW(dump("x = 1", "t"), RuntimeFault);
}

TEST_F(LuaInterpreterTest, RuntimeErrorIsToolFailure) {
    EXPECT_THROW(dump("error('boom')", "t"), ToolFailure);
}
}  // namespace
}  // namespace romc::script
