/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script_decoder.h"

#include "script/script_chunk.h"
#include "script/script_errors.h"
#include "script/script_literal.h"
#include "script/script_payload.h"
#include "script/script_runtime.h"
#include "script/script_tools.h"
#include "utils/log.h"

#include <chrono>
#include <cstdlib>
#include <exception>
#include <stdexcept>

namespace romc {

static std::optional<std::string> read_env(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) {
        return std::nullopt;
    }
    return std::string(v);
}

static long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - since
        )
            .count()
    );
}

DecoderConfig DecoderConfig::from_environment(DecoderConfig base) {
    if (!base.runtime_library.has_value()) {
        auto lib = read_env("SLUA_LIB");
        if (!lib.has_value()) {
            lib = read_env("SLUA_DLL");
        }
        if (lib.has_value()) {
            base.runtime_library = std::filesystem::path(*lib);
        }
    }
    if (!base.decompiler_jar.has_value()) {
        if (const auto jar = read_env("ROMC_UNLUAC_JAR")) {
            base.decompiler_jar = std::filesystem::path(*jar);
        }
    }
    if (base.java_executable.empty()) {
        if (const auto java = read_env("ROMC_JAVA")) {
            base.java_executable = *java;
        }
    }
    if (!base.lua_executable.has_value()) {
        if (const auto lua = read_env("ROMC_LUA_PATH")) {
            base.lua_executable = std::filesystem::path(*lua);
        }
    }
    return base;
}

static script::ProcessToolsOptions tools_options(const DecoderConfig& config) {
    script::ProcessToolsOptions opt{};
    opt.decompiler_command = config.decompiler_command;
    opt.decompiler_jar = config.decompiler_jar;
    if (!config.java_executable.empty()) {
        opt.java_executable = config.java_executable;
    }
    opt.lua_executable = config.lua_executable;
    opt.debug = config.debug;
    return opt;
}

ScriptDecoder::ScriptDecoder(const DecoderConfig& config)
    : _runtime(std::make_shared<script::NativeRuntime>(config.runtime_library)),
      _tools(std::make_shared<script::ProcessTools>(tools_options(config))),
      _debug(config.debug) {}

ScriptDecoder::ScriptDecoder(
    std::shared_ptr<script::ScriptRuntime> runtime,
    std::shared_ptr<script::ExternalTools> tools,
    bool debug
)
    : _runtime(std::move(runtime)), _tools(std::move(tools)), _debug(debug) {
    if (!_runtime) {
        _runtime = std::make_shared<script::UnavailableRuntime>();
    }
    if (!_tools) {
        throw std::invalid_argument("ScriptDecoder requires an ExternalTools instance");
    }
}

std::string ScriptDecoder::decode_to_text(
    std::span<const std::uint8_t> blob,
    std::span<const std::uint8_t> companion
) const {
    return decode_at_depth(blob, companion, 0);
}

std::string ScriptDecoder::decode_at_depth(
    std::span<const std::uint8_t> blob,
    std::span<const std::uint8_t> companion,
    int depth
) const {
    if (blob.empty()) {
        return {};
    }
    if (!script::has_script_marker(blob)) {
        return script::decode_utf8_lossy(blob);
    }

    std::exception_ptr last_error;
    std::optional<std::vector<std::uint8_t>> chunk;

    const auto t0 = std::chrono::steady_clock::now();
    try {
        chunk = _runtime->compile(blob);
    } catch (const script::RuntimeUnavailable& ex) {
        last_error = std::current_exception();
        if (_debug) {
            ROMC_LOG_INFO("Native compile unavailable (depth %d): %s", depth, ex.what());
        }
        try {
            chunk = script::synthesize_chunk(blob);
        } catch (const script::FormatError& synth_ex) {
            if (_debug) {
                ROMC_LOG_INFO("Header synthesis failed: %s", synth_ex.what());
            }
        }
    } catch (const script::ScriptError& ex) {
        last_error = std::current_exception();
        if (_debug) {
            ROMC_LOG_INFO("Native compile failed (depth %d): %s", depth, ex.what());
        }
    }
    const auto compile_ms = elapsed_ms(t0);

    if (chunk.has_value()) {
        const auto t1 = std::chrono::steady_clock::now();
        try {
            std::string text = _tools->decompile(*chunk);
            if (_debug) {
                ROMC_LOG_INFO(
                    "Decoded marker blob: bytes=%zu chunk=%zu compile=%lldms decompile=%lldms",
                    blob.size(), chunk->size(), compile_ms, elapsed_ms(t1)
                );
            }
            return text;
        } catch (const script::ScriptError& ex) {
            last_error = std::current_exception();
            if (_debug) {
                ROMC_LOG_INFO("Decompile failed (depth %d): %s", depth, ex.what());
            }
        }
    }

    for (const auto candidate : {blob, companion}) {
        if (candidate.empty()) {
            continue;
        }
        const auto decrypted = script::unwrap_payload(candidate);
        if (!decrypted.has_value() || decrypted->empty()) {
            continue;
        }
        if (_debug) {
            ROMC_LOG_INFO(
                "Unwrapped payload (depth %d): %zu -> %zu bytes", depth, candidate.size(),
                decrypted->size()
            );
        }
        if (!script::has_script_marker(*decrypted)) {
            return script::decode_utf8_lossy(*decrypted);
        }
        if (depth >= kMaxUnwrapDepth) {
            throw script::FormatError(
                "Nested script payload exceeds " + std::to_string(kMaxUnwrapDepth)
                + " unwrap levels"
            );
        }
        return decode_at_depth(*decrypted, {}, depth + 1);
    }

    if (last_error) {
        std::rethrow_exception(last_error);
    }
    throw script::FormatError("Unsupported Lua blob format");
}

script::LuaValue ScriptDecoder::dump_table(
    std::span<const std::uint8_t> blob,
    std::string_view table_name
) const {
    if (blob.empty()) {
        return script::LuaValue::object();
    }

    const auto t0 = std::chrono::steady_clock::now();
    try {
        auto value = _runtime->run_and_extract(blob, table_name);
        if (_debug) {
            ROMC_LOG_INFO(
                "Native dump '%s': %lldms", std::string(table_name).c_str(), elapsed_ms(t0)
            );
        }
        return value;
    } catch (const script::RuntimeUnavailable& ex) {
        if (_debug) {
            ROMC_LOG_INFO("Native runtime unavailable, using external interpreter: %s", ex.what());
        }
    }

    std::vector<std::uint8_t> chunk;
    try {
        chunk = _runtime->compile(blob);
    } catch (const script::RuntimeUnavailable&) {
        if (script::has_script_marker(blob)) {
            chunk = script::synthesize_chunk(blob);
        } else {
            chunk.assign(blob.begin(), blob.end());
        }
    }

    const auto t1 = std::chrono::steady_clock::now();
    auto value = _tools->dump_table(chunk, table_name);
    if (_debug) {
        ROMC_LOG_INFO(
            "External dump '%s': chunk=%zu %lldms", std::string(table_name).c_str(), chunk.size(),
            elapsed_ms(t1)
        );
    }
    return value;
}

script::TableSnapshot ScriptDecoder::snapshot(
    std::span<const std::uint8_t> blob,
    std::string_view table_name
) const {
    return {std::string(table_name), dump_table(blob, table_name)};
}

std::string ScriptDecoder::text_from_asset(
    std::span<const std::uint8_t> blob,
    std::span<const std::uint8_t> companion
) const {
    if (script::has_script_marker(blob)) {
        try {
            return decode_to_text(blob, companion);
        } catch (const std::runtime_error& ex) {
            if (_debug) {
                ROMC_LOG_INFO("Falling back to raw text: %s", ex.what());
            }
        }
    }
    return script::decode_utf8_lossy(blob);
}

std::vector<script::LuaValue> ScriptDecoder::parse_records(
    std::span<const std::uint8_t> blob,
    std::span<const std::uint8_t> companion
) const {
    return script::parse_records(text_from_asset(blob, companion));
}

std::string ScriptDecoder::text_from_asset(
    std::u16string_view text,
    std::span<const std::uint8_t> companion
) const {
    const auto bytes = script::coerce_script_bytes(text);
    return text_from_asset(std::span<const std::uint8_t>(bytes), companion);
}

std::vector<script::LuaValue> ScriptDecoder::parse_records(
    std::u16string_view text,
    std::span<const std::uint8_t> companion
) const {
    return script::parse_records(text_from_asset(text, companion));
}

}  // namespace romc
