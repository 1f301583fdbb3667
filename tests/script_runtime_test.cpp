/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "script/script_errors.h"
#include "script/script_runtime.h"
#include "test_helpers.h"
#include "utils/fs_utils.h"

#include <cstdlib>
#include <string>

namespace romc::script {
namespace {
using test::bytes_of;

TEST(UnavailableRuntimeTest, EveryCallIsUnavailable) {
    UnavailableRuntime runtime("no runtime in tests");
    const auto blob = bytes_of("t = {}");
    EXPECT_THROW(runtime.compile(blob), RuntimeUnavailable);
    EXPECT_THROW(runtime.run_and_extract(blob, "t"), RuntimeUnavailable);
}

TEST(NativeRuntimeTest, MissingLibraryIsUnavailable) {
    fs_utils::ScopedTempDir tmp;
    NativeRuntime runtime(tmp.path() / "libslua-missing.so");
    const auto blob = bytes_of("t = {}");
    try {
        runtime.compile(blob);
        FAIL() << "expected RuntimeUnavailable";
    } catch (const RuntimeUnavailable& ex) {
        EXPECT_NE(std::string(ex.what()).find("not found"), std::string::npos);
    }
    // The failure is cached until reset().
    EXPECT_THROW(runtime.run_and_extract(blob, "t"), RuntimeUnavailable);
    runtime.reset();
    EXPECT_THROW(runtime.compile(blob), RuntimeUnavailable);
}

TEST(NativeRuntimeTest, NonLibraryFileIsUnavailable) {
    fs_utils::ScopedTempDir tmp;
    const auto fake = tmp.path() / "libslua.so";
    fs_utils::write_text_file(fake, "not a shared object");
    NativeRuntime runtime(fake);
    EXPECT_THROW(runtime.compile(bytes_of("t = {}")), RuntimeUnavailable);
}

TEST(NativeRuntimeTest, LibraryPathDefaultsNextToExecutable) {
    NativeRuntime runtime;
    EXPECT_EQ(runtime.library_path().parent_path().string(), fs_utils::executable_dir().string());

    NativeRuntime configured(std::filesystem::path("/opt/romc/libslua.so"));
    EXPECT_EQ(configured.library_path().string(), "/opt/romc/libslua.so");
}

TEST(NativeRuntimeTest, EmptyBlob) {
    fs_utils::ScopedTempDir tmp;
    NativeRuntime runtime(tmp.path() / "missing.so");
    EXPECT_TRUE(runtime.compile({}).empty());
    const auto v = runtime.run_and_extract({}, "t");
    EXPECT_TRUE(v.is_object());
    EXPECT_TRUE(v.empty());
}

// Exercised against a stock Lua 5.3 shared library: the one found at configure time, or
// ROMC_TEST_LUA_LIB=/usr/lib/x86_64-linux-gnu/liblua5.3.so.0
std::string stock_lua_library() {
    const char* lib = std::getenv("ROMC_TEST_LUA_LIB");
    if (lib && *lib) {
        return lib;
    }
#ifdef ROMC_TEST_LUA_LIB_PATH
    return ROMC_TEST_LUA_LIB_PATH;
#else
    return {};
#endif
}

class StockLuaRuntimeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const std::string lib = stock_lua_library();
        if (lib.empty()) {
            GTEST_SKIP() << "no Lua 5.3 library configured";
        }
        _runtime = std::make_unique<NativeRuntime>(std::filesystem::path(lib));
        try {
            _runtime->compile(bytes_of("return 1"));
        } catch (const RuntimeUnavailable& ex) {
            GTEST_SKIP() << "Lua 5.3 library unusable: " << ex.what();
        }
    }

    LuaValue extract(std::string_view source, std::string_view name) {
        return _runtime->run_and_extract(bytes_of(source), name);
    }

    std::unique_ptr<NativeRuntime> _runtime;
};

TEST_F(StockLuaRuntimeTest, DenseTableIsArray) {
    EXPECT_EQ(extract("t = {1, 2, 3}", "t"), LuaValue::parse("[1,2,3]"));
}

TEST_F(StockLuaRuntimeTest, GapIsObject) {
    EXPECT_EQ(extract("t = {[1] = 'a', [3] = 'c'}", "t").dump(), R"({"1":"a","3":"c"})");
}

TEST_F(StockLuaRuntimeTest, IntegersAndFloats) {
    const auto v = extract("t = {i = 3, f = 3.0, h = 0.5, s = 'x', b = true}", "t");
    EXPECT_TRUE(v["i"].is_number_integer());
    EXPECT_TRUE(v["f"].is_number_float());
    EXPECT_DOUBLE_EQ(v["h"].get<double>(), 0.5);
    EXPECT_EQ(v["s"], "x");
    EXPECT_EQ(v["b"], true);
}

TEST_F(StockLuaRuntimeTest, CycleBecomesNull) {
    const auto v = extract("t = {x = 1}; t.self = t; t.list = {t, 2}", "t");
    EXPECT_EQ(v.dump(), R"({"list":[null,2],"self":null,"x":1})");
}

TEST_F(StockLuaRuntimeTest, SharedSubtableIsNotACycle) {
    const auto v = extract("local s = {1}; t = {a = s, b = s}", "t");
    EXPECT_EQ(v.dump(), R"({"a":[1],"b":[1]})");
}

TEST_F(StockLuaRuntimeTest, FunctionsBecomeNull) {
    const auto v = extract("t = {f = print, n = 1}", "t");
    EXPECT_TRUE(v["f"].is_null());
}

TEST_F(StockLuaRuntimeTest, MissingTableIsFault) {
    EXPECT_THROW(extract("x = 1", "t"), RuntimeFault);
    EXPECT_THROW(extract("t = 5", "t"), RuntimeFault);
}

TEST_F(StockLuaRuntimeTest, ErrorsAreFaults) {
    EXPECT_THROW(extract("t = {", "t"), RuntimeFault);
    EXPECT_THROW(extract("error('boom')", "t"), RuntimeFault);
}

TEST_F(StockLuaRuntimeTest, CompileDumpsBytecode) {
    const auto chunk = _runtime->compile(bytes_of("return 1"));
    ASSERT_GE(chunk.size(), 4u);
    EXPECT_EQ(chunk[0], 0x1B);
    EXPECT_EQ(chunk[1], 'L');
}

TEST_F(StockLuaRuntimeTest, EncodedBlobNeedsRomLoader) {
    std::vector<std::uint8_t> blob(300, 0);
    blob[0] = 0x2A;
    EXPECT_THROW(_runtime->compile(blob), RuntimeUnavailable);
}
}  // namespace
}  // namespace romc::script
