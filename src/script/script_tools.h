/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "script/script_value.h"
#include "utils/resolved_path.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace romc::script {
/**
 * Out-of-process fallbacks: a bytecode decompiler and a stock Lua interpreter.
 * Missing programs raise RuntimeUnavailable; programs that run and fail raise ToolFailure
 * (or RuntimeFault when the interpreter reports that the requested table does not exist).
 */
class ExternalTools {
   public:
    virtual ~ExternalTools() = default;

    virtual std::string decompile(std::span<const std::uint8_t> chunk) = 0;
    virtual LuaValue dump_table(std::span<const std::uint8_t> chunk, std::string_view table_name) = 0;
};

struct ProcessToolsOptions {
    // Full decompiler argv prefix; the chunk path is appended. Empty means java -jar <jar>.
    std::vector<std::string> decompiler_command;
    std::optional<std::filesystem::path> decompiler_jar;
    std::string java_executable = "java";
    std::optional<std::filesystem::path> lua_executable;
    bool debug = false;
};

class ProcessTools final : public ExternalTools {
   public:
    explicit ProcessTools(ProcessToolsOptions opt = {});

    std::string decompile(std::span<const std::uint8_t> chunk) override;
    LuaValue dump_table(std::span<const std::uint8_t> chunk, std::string_view table_name) override;

    std::vector<std::string> decompiler_argv();
    std::filesystem::path lua_path();
    void reset_resolved_paths();

   private:
    ProcessToolsOptions _opt;
    utils::ResolvedPath _jar_path;
    utils::ResolvedPath _lua_path;
};

// Lua program run by dump_table: `lua <script> <chunk> <table_name>` prints the table as JSON.
std::string_view table_dump_script();

// Parses the interpreter's JSON output. Empty output is an empty table.
LuaValue parse_table_dump(std::string_view output);
}  // namespace romc::script
