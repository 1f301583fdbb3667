/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "script/script_value.h"
#include "utils/resolved_path.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace romc::lua {
class LuaApi;
struct State;
}

namespace romc::script {
/**
 * Embedded interpreter seam. Every call runs in its own interpreter state, which is closed
 * before the call returns.
 *
 * Throws RuntimeUnavailable when the interpreter cannot be used at all and RuntimeFault when
 * it ran but failed on this blob.
 */
class ScriptRuntime {
   public:
    virtual ~ScriptRuntime() = default;

    // Loads the blob without running it and returns the dumped bytecode.
    virtual std::vector<std::uint8_t> compile(std::span<const std::uint8_t> blob) = 0;

    // Loads and runs the blob, then marshals global `table_name` (which must be a table).
    virtual LuaValue run_and_extract(
        std::span<const std::uint8_t> blob,
        std::string_view table_name
    ) = 0;
};

// Backed by the game's Lua 5.3 shared library, loaded on first use.
class NativeRuntime final : public ScriptRuntime {
   public:
    explicit NativeRuntime(std::optional<std::filesystem::path> library_path = std::nullopt);
    ~NativeRuntime() override;

    std::vector<std::uint8_t> compile(std::span<const std::uint8_t> blob) override;
    LuaValue run_and_extract(
        std::span<const std::uint8_t> blob,
        std::string_view table_name
    ) override;

    std::filesystem::path library_path();
    // Forgets the resolved path and the loaded library (or the cached load failure).
    void reset();

   private:
    std::shared_ptr<const lua::LuaApi> api();

    std::optional<std::filesystem::path> _configured_path;
    utils::ResolvedPath _resolved_path;
    std::mutex _mutex;
    std::shared_ptr<const lua::LuaApi> _api;
    std::optional<std::string> _load_error;
};

// Stand-in used when no native interpreter is configured; every call is RuntimeUnavailable.
class UnavailableRuntime final : public ScriptRuntime {
   public:
    explicit UnavailableRuntime(std::string reason = "native Lua runtime not configured");

    std::vector<std::uint8_t> compile(std::span<const std::uint8_t> blob) override;
    LuaValue run_and_extract(
        std::span<const std::uint8_t> blob,
        std::string_view table_name
    ) override;

   private:
    std::string _reason;
};

/**
 * Converts the table at stack index `idx` into a LuaValue using the TableBuilder rules.
 * A table met again while it is still being expanded becomes null, as do functions,
 * userdata and non-finite numbers. The stack is left as it was found.
 */
LuaValue marshal_table(const lua::LuaApi& api, lua::State* L, int idx);
}  // namespace romc::script
