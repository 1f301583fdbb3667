/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "script/script_chunk.h"
#include "script/script_errors.h"
#include "script/script_payload.h"
#include "script/script_runtime.h"
#include "script/script_tools.h"
#include "script_decoder.h"
#include "test_helpers.h"

#include <cstdlib>
#include <functional>

namespace romc {
namespace {
using script::LuaValue;
using test::bytes_of;
using test::concat;

using Bytes = std::vector<std::uint8_t>;

class FakeRuntime : public script::ScriptRuntime {
   public:
    std::function<Bytes(std::span<const std::uint8_t>)> on_compile = [](auto) -> Bytes {
        throw script::RuntimeUnavailable("fake runtime unavailable");
    };
    std::function<LuaValue(std::span<const std::uint8_t>, std::string_view)> on_extract =
        [](auto, auto) -> LuaValue { throw script::RuntimeUnavailable("fake runtime unavailable"); };

    int compile_calls = 0;
    int extract_calls = 0;

    Bytes compile(std::span<const std::uint8_t> blob) override {
        compile_calls++;
        return on_compile(blob);
    }

    LuaValue run_and_extract(std::span<const std::uint8_t> blob, std::string_view name) override {
        extract_calls++;
        return on_extract(blob, name);
    }
};

class FakeTools : public script::ExternalTools {
   public:
    std::function<std::string(std::span<const std::uint8_t>)> on_decompile =
        [](std::span<const std::uint8_t> chunk) { return "-- " + std::to_string(chunk.size()); };
    std::function<LuaValue(std::span<const std::uint8_t>, std::string_view)> on_dump =
        [](auto, auto) { return LuaValue::parse(R"({"from":"tool"})"); };

    std::vector<Bytes> decompiled;
    std::vector<Bytes> dumped;

    std::string decompile(std::span<const std::uint8_t> chunk) override {
        decompiled.emplace_back(chunk.begin(), chunk.end());
        return on_decompile(chunk);
    }

    LuaValue dump_table(std::span<const std::uint8_t> chunk, std::string_view name) override {
        dumped.emplace_back(chunk.begin(), chunk.end());
        return on_dump(chunk, name);
    }
};

// 0x2A, opaque region, source path, NUL, opcode stream.
Bytes encoded_chunk(const Bytes& ops) {
    Bytes blob(1 + script::kOpaqueRegionSize, 0x11);
    blob[0] = script::kScriptMarker;
    const auto path = bytes_of("@Script/Config/Table_Item.lua");
    blob.insert(blob.end(), path.begin(), path.end());
    blob.push_back(0);
    blob.insert(blob.end(), ops.begin(), ops.end());
    return blob;
}

// Marker byte followed by an encrypted payload.
Bytes marker_wrap(const Bytes& plain) {
    const Bytes prefix = {script::kScriptMarker};
    return script::wrap_payload(plain, prefix);
}

class ScriptDecoderTest : public ::testing::Test {
   protected:
    ScriptDecoder decoder() { return ScriptDecoder(_runtime, _tools); }

    std::shared_ptr<FakeRuntime> _runtime = std::make_shared<FakeRuntime>();
    std::shared_ptr<FakeTools> _tools = std::make_shared<FakeTools>();
};

// =============================================================================
// decode_to_text
// =============================================================================

TEST_F(ScriptDecoderTest, EmptyBlob) {
    EXPECT_EQ(decoder().decode_to_text({}), "");
    EXPECT_EQ(_runtime->compile_calls, 0);
}

TEST_F(ScriptDecoderTest, PlainBlobIsReturnedUnchanged) {
    const std::string source = "local t = {id=1, name='\xE6\x9D\x8E'}\n";
    EXPECT_EQ(decoder().decode_to_text(bytes_of(source)), source);
    EXPECT_EQ(_runtime->compile_calls, 0);
    EXPECT_TRUE(_tools->decompiled.empty());
}

TEST_F(ScriptDecoderTest, PlainBlobDropsInvalidUtf8) {
    const Bytes blob = {'a', 0xFF, 'b'};
    EXPECT_EQ(decoder().decode_to_text(blob), "ab");
}

TEST_F(ScriptDecoderTest, NativeCompileFeedsDecompiler) {
    _runtime->on_compile = [](auto) { return Bytes{0x1B, 'L', 'u', 'a'}; };
    _tools->on_decompile = [](auto) { return std::string("return {}"); };

    EXPECT_EQ(decoder().decode_to_text(encoded_chunk({1, 2})), "return {}");
    ASSERT_EQ(_tools->decompiled.size(), 1u);
    EXPECT_EQ(_tools->decompiled[0], (Bytes{0x1B, 'L', 'u', 'a'}));
}

TEST_F(ScriptDecoderTest, UnavailableRuntimeUsesSynthesizedHeader) {
    const Bytes ops = {0x08, 0x00, 0x00, 0x00, 0x2A};
    decoder().decode_to_text(encoded_chunk(ops));
    ASSERT_EQ(_tools->decompiled.size(), 1u);
    EXPECT_EQ(_tools->decompiled[0], concat({script::build_luac_header(), ops}));
}

TEST_F(ScriptDecoderTest, CompileFaultSkipsSynthesisAndUnwraps) {
    _runtime->on_compile = [](auto) -> Bytes { throw script::RuntimeFault("bad chunk"); };
    const auto blob = marker_wrap(bytes_of("return 'plain'"));
    EXPECT_EQ(decoder().decode_to_text(blob), "return 'plain'");
    EXPECT_TRUE(_tools->decompiled.empty());
}

TEST_F(ScriptDecoderTest, DecompileFailureFallsBackToUnwrap) {
    _runtime->on_compile = [](auto) { return Bytes{1}; };
    _tools->on_decompile = [](auto) -> std::string { throw script::ToolFailure("unluac failed"); };
    const auto blob = marker_wrap(bytes_of("x = 1"));
    EXPECT_EQ(decoder().decode_to_text(blob), "x = 1");
}

TEST_F(ScriptDecoderTest, CompanionIsTriedAfterBlob) {
    const Bytes blob = {script::kScriptMarker, 1, 2, 3};
    const auto companion = script::wrap_payload(bytes_of("from companion"), bytes_of("raw-header"));
    EXPECT_EQ(decoder().decode_to_text(blob, companion), "from companion");
}

TEST_F(ScriptDecoderTest, NothingWorksRaisesCompileError) {
    const Bytes blob = {script::kScriptMarker, 1, 2, 3};
    try {
        decoder().decode_to_text(blob);
        FAIL() << "expected RuntimeUnavailable";
    } catch (const script::RuntimeUnavailable& ex) {
        EXPECT_STREQ(ex.what(), "fake runtime unavailable");
    }
}

TEST_F(ScriptDecoderTest, NothingWorksRaisesLatestError) {
    _tools->on_decompile = [](auto) -> std::string { throw script::ToolFailure("unluac failed"); };
    EXPECT_THROW(decoder().decode_to_text(encoded_chunk({1})), script::ToolFailure);
}

TEST_F(ScriptDecoderTest, DoublyWrappedBlobUnwrapsTwice) {
    const auto inner = marker_wrap(bytes_of("Table = {id=5}"));
    const auto outer = marker_wrap(inner);
    EXPECT_EQ(decoder().decode_to_text(outer), "Table = {id=5}");
    // One compile attempt per level: the outer blob and the once-unwrapped blob.
    EXPECT_EQ(_runtime->compile_calls, 2);
}

TEST_F(ScriptDecoderTest, EndlessMarkerChainFailsCleanly) {
    Bytes blob = {script::kScriptMarker, 0x00};
    for (int i = 0; i <= kMaxUnwrapDepth + 1; i++) {
        blob = marker_wrap(blob);
    }
    EXPECT_THROW(decoder().decode_to_text(blob), script::FormatError);
    EXPECT_EQ(_runtime->compile_calls, kMaxUnwrapDepth + 1);
}

// =============================================================================
// dump_table
// =============================================================================

TEST_F(ScriptDecoderTest, DumpEmptyBlob) {
    const auto v = decoder().dump_table({}, "t");
    EXPECT_TRUE(v.is_object());
    EXPECT_TRUE(v.empty());
    EXPECT_EQ(_runtime->extract_calls, 0);
}

TEST_F(ScriptDecoderTest, DumpPrefersNativeRuntime) {
    _runtime->on_extract = [](auto, std::string_view name) {
        return LuaValue::parse(R"({"native":")" + std::string(name) + R"("})");
    };
    EXPECT_EQ(decoder().dump_table(bytes_of("t = {}"), "t").dump(), R"({"native":"t"})");
    EXPECT_TRUE(_tools->dumped.empty());
}

TEST_F(ScriptDecoderTest, DumpFallsBackToCompiledChunk) {
    _runtime->on_compile = [](auto) { return Bytes{0x1B, 0x4C}; };
    EXPECT_EQ(decoder().dump_table(encoded_chunk({1}), "t").dump(), R"({"from":"tool"})");
    ASSERT_EQ(_tools->dumped.size(), 1u);
    EXPECT_EQ(_tools->dumped[0], (Bytes{0x1B, 0x4C}));
}

TEST_F(ScriptDecoderTest, DumpFallsBackToSynthesizedChunk) {
    const Bytes ops = {0x05, 0x06};
    decoder().dump_table(encoded_chunk(ops), "t");
    ASSERT_EQ(_tools->dumped.size(), 1u);
    EXPECT_EQ(_tools->dumped[0], concat({script::build_luac_header(), ops}));
}

TEST_F(ScriptDecoderTest, DumpPassesSourceThrough) {
    const auto source = bytes_of("t = {1, 2}");
    decoder().dump_table(source, "t");
    ASSERT_EQ(_tools->dumped.size(), 1u);
    EXPECT_EQ(_tools->dumped[0], source);
}

TEST_F(ScriptDecoderTest, DumpFaultDoesNotFallBack) {
    _runtime->on_extract = [](auto, auto) -> LuaValue {
        throw script::RuntimeFault("table 't' not found");
    };
    EXPECT_THROW(decoder().dump_table(bytes_of("x = 1"), "t"), script::RuntimeFault);
    EXPECT_EQ(_runtime->compile_calls, 0);
    EXPECT_TRUE(_tools->dumped.empty());
}

TEST_F(ScriptDecoderTest, SnapshotCarriesName) {
    const auto snap = decoder().snapshot(bytes_of("t = {}"), "Table_Item");
    EXPECT_EQ(snap.name, "Table_Item");
    EXPECT_EQ(snap.value.dump(), R"({"from":"tool"})");
}

// =============================================================================
// text_from_asset / parse_records
// =============================================================================

TEST_F(ScriptDecoderTest, TextFromAssetFallsBackToRawBytes) {
    const Bytes blob = {script::kScriptMarker, 'i', 'd', '=', '1'};
    EXPECT_EQ(decoder().text_from_asset(blob), "*id=1");
}

TEST_F(ScriptDecoderTest, TextAssetIsEncodedAsUtf8) {
    EXPECT_EQ(decoder().text_from_asset(u"Name='\u00e9'"), "Name='\xC3\xA9'");
    EXPECT_EQ(decoder().text_from_asset(u"*id=1"), "*id=1");
    EXPECT_EQ(_runtime->compile_calls, 1);
}

TEST_F(ScriptDecoderTest, ParseRecordsFromTextAsset) {
    const auto records = decoder().parse_records(u"T = {[1] = {id=1, n='\u4e00'}}");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0]["n"], "\xE4\xB8\x80");
}

TEST_F(ScriptDecoderTest, ParseRecordsFromEncryptedAsset) {
    _runtime->on_compile = [](auto) -> Bytes { throw script::RuntimeFault("not a chunk"); };
    const auto blob = marker_wrap(bytes_of("Table_Item = {[1] = {id=1, n='a'}, [2] = {id=2, n='b'}}"));
    const auto records = decoder().parse_records(blob);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].dump(), R"({"id":1,"n":"a"})");
    EXPECT_EQ(records[1].dump(), R"({"id":2,"n":"b"})");
}

TEST(ScriptDecoderConstructionTest, RequiresTools) {
    EXPECT_THROW(ScriptDecoder(nullptr, nullptr), std::invalid_argument);
}

TEST(ScriptDecoderConstructionTest, MissingRuntimeMeansUnavailable) {
    auto tools = std::make_shared<FakeTools>();
    const ScriptDecoder decoder(nullptr, tools);
    EXPECT_EQ(decoder.dump_table(bytes_of("t = {}"), "t").dump(), R"({"from":"tool"})");
}

#if !defined(_WIN32)
TEST(DecoderConfigTest, EnvironmentFillsUnsetFields) {
    ::setenv("SLUA_LIB", "/env/libslua.so", 1);
    ::setenv("ROMC_UNLUAC_JAR", "/env/unluac.jar", 1);
    ::setenv("ROMC_JAVA", "/env/java", 1);
    ::setenv("ROMC_LUA_PATH", "/env/lua", 1);

    DecoderConfig base{};
    base.lua_executable = std::filesystem::path("/cli/lua");
    const auto cfg = DecoderConfig::from_environment(base);
    ASSERT_TRUE(cfg.runtime_library.has_value());
    ASSERT_TRUE(cfg.decompiler_jar.has_value());
    ASSERT_TRUE(cfg.lua_executable.has_value());
    EXPECT_EQ(cfg.runtime_library->string(), "/env/libslua.so");
    EXPECT_EQ(cfg.decompiler_jar->string(), "/env/unluac.jar");
    EXPECT_EQ(cfg.java_executable, "/env/java");
    EXPECT_EQ(cfg.lua_executable->string(), "/cli/lua");

    ::unsetenv("SLUA_LIB");
    ::setenv("SLUA_DLL", "/env/alias.so", 1);
    const auto aliased = DecoderConfig::from_environment();
    ASSERT_TRUE(aliased.runtime_library.has_value());
    EXPECT_EQ(aliased.runtime_library->string(), "/env/alias.so");

    ::unsetenv("SLUA_DLL");
    ::unsetenv("ROMC_UNLUAC_JAR");
    ::unsetenv("ROMC_JAVA");
    ::unsetenv("ROMC_LUA_PATH");
    const auto empty = DecoderConfig::from_environment();
    EXPECT_FALSE(empty.runtime_library.has_value());
    EXPECT_TRUE(empty.java_executable.empty());
}
#endif
}  // namespace
}  // namespace romc
