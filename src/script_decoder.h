/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "script/script_value.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace romc::script {
class ScriptRuntime;
class ExternalTools;
}  // namespace romc::script

namespace romc {

// Marker-prefixed payloads found inside a decrypted payload are followed at most this many
// levels below the top-level call.
constexpr int kMaxUnwrapDepth = 2;

struct DecoderConfig {
    std::optional<std::filesystem::path> runtime_library;
    std::vector<std::string> decompiler_command;
    std::optional<std::filesystem::path> decompiler_jar;
    std::string java_executable;
    std::optional<std::filesystem::path> lua_executable;
    bool debug = false;

    // Fills fields left unset in `base` from SLUA_LIB (or SLUA_DLL), ROMC_UNLUAC_JAR,
    // ROMC_JAVA and ROMC_LUA_PATH.
    static DecoderConfig from_environment(DecoderConfig base);
    static DecoderConfig from_environment() { return from_environment(DecoderConfig{}); }
};

class ScriptDecoder {
   public:
    explicit ScriptDecoder(const DecoderConfig& config = {});
    ScriptDecoder(
        std::shared_ptr<script::ScriptRuntime> runtime,
        std::shared_ptr<script::ExternalTools> tools,
        bool debug = false
    );

    /**
     * Source text for a script blob. Plain blobs are returned as lossy UTF-8. Marker blobs go
     * through the native compiler (or the synthesized header when the native runtime is
     * unavailable) and the decompiler; when that fails the blob and then the companion are
     * tried as encrypted payloads.
     */
    std::string decode_to_text(
        std::span<const std::uint8_t> blob,
        std::span<const std::uint8_t> companion = {}
    ) const;

    /**
     * Runs the blob and returns global `table_name`. The native runtime is preferred; when it
     * is unavailable the chunk is handed to the external interpreter. A missing table is a
     * RuntimeFault and is not retried.
     */
    script::LuaValue dump_table(std::span<const std::uint8_t> blob, std::string_view table_name)
        const;

    script::TableSnapshot snapshot(std::span<const std::uint8_t> blob, std::string_view table_name)
        const;

    // decode_to_text for marker blobs with lossy UTF-8 of the raw bytes on any failure.
    std::string text_from_asset(
        std::span<const std::uint8_t> blob,
        std::span<const std::uint8_t> companion = {}
    ) const;

    std::vector<script::LuaValue> parse_records(
        std::span<const std::uint8_t> blob,
        std::span<const std::uint8_t> companion = {}
    ) const;

    // Text-typed assets hold the script as UTF-16 code units; they are encoded with
    // script::coerce_script_bytes and then handled like a blob.
    std::string text_from_asset(
        std::u16string_view text,
        std::span<const std::uint8_t> companion = {}
    ) const;
    std::vector<script::LuaValue> parse_records(
        std::u16string_view text,
        std::span<const std::uint8_t> companion = {}
    ) const;

   private:
    std::string decode_at_depth(
        std::span<const std::uint8_t> blob,
        std::span<const std::uint8_t> companion,
        int depth
    ) const;

    std::shared_ptr<script::ScriptRuntime> _runtime;
    std::shared_ptr<script::ExternalTools> _tools;
    bool _debug = false;
};

}  // namespace romc
