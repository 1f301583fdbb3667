/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_tools.h"
#include "script/script_errors.h"
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "utils/subprocess.h"

#include <chrono>

namespace fs = std::filesystem;

namespace romc::script {
namespace {
// Exit status the dump script uses when the global is missing or not a table.
constexpr int kTableMissingExit = 3;
// What shells and posix_spawn report for a program that could not be executed.
constexpr int kCommandNotFoundExit = 127;

constexpr std::string_view kTableDumpScript = R"lua(
local chunk_path, table_name = ...
local env = setmetatable({}, { __index = _G })
local chunk, load_err = loadfile(chunk_path, "bt", env)
if not chunk then
  io.stderr:write(tostring(load_err), "\n")
  os.exit(1)
end
local ok, run_err = pcall(chunk)
if not ok then
  io.stderr:write(tostring(run_err), "\n")
  os.exit(1)
end
local target = rawget(env, table_name)
if target == nil then
  target = _G[table_name]
end
if type(target) ~= "table" then
  io.stderr:write(string.format("table '%s' not found\n", table_name))
  os.exit(3)
end

local function escape(s)
  return (s:gsub('[%c"\\]', function(c)
    if c == '"' then return '\\"' end
    if c == "\\" then return "\\\\" end
    if c == "\n" then return "\\n" end
    if c == "\r" then return "\\r" end
    if c == "\t" then return "\\t" end
    return string.format("\\u%04x", c:byte())
  end))
end

local function number_repr(n)
  if n ~= n or n == math.huge or n == -math.huge then
    return "null"
  end
  if math.type(n) == "integer" then
    return string.format("%d", n)
  end
  local s = string.format("%.17g", n)
  if not s:find("[%.eEn]") then
    s = s .. ".0"
  end
  return s
end

local function key_string(k)
  if type(k) == "string" then
    return k
  end
  return tostring(k)
end

local function key_less(a, b)
  local an, bn = type(a) == "number", type(b) == "number"
  if an and bn then
    return a < b
  end
  if an ~= bn then
    return an
  end
  return key_string(a) < key_string(b)
end

local function array_length(t)
  local count, max = 0, 0
  for k in pairs(t) do
    if math.type(k) ~= "integer" or k < 1 then
      return nil
    end
    count = count + 1
    if k > max then
      max = k
    end
  end
  if count > 0 and count == max then
    return max
  end
  return nil
end

local visiting = {}
local encode

local function encode_table(t)
  local parts = {}
  local n = array_length(t)
  if n then
    for i = 1, n do
      parts[i] = encode(t[i])
    end
    return "[" .. table.concat(parts, ",") .. "]"
  end
  local keys = {}
  for k in pairs(t) do
    keys[#keys + 1] = k
  end
  table.sort(keys, key_less)
  for i, k in ipairs(keys) do
    parts[i] = '"' .. escape(key_string(k)) .. '":' .. encode(t[k])
  end
  return "{" .. table.concat(parts, ",") .. "}"
end

encode = function(v)
  local t = type(v)
  if t == "boolean" then
    return tostring(v)
  elseif t == "number" then
    return number_repr(v)
  elseif t == "string" then
    return '"' .. escape(v) .. '"'
  elseif t == "table" then
    if visiting[v] then
      return "null"
    end
    visiting[v] = true
    local out = encode_table(v)
    visiting[v] = nil
    return out
  end
  return "null"
end

io.write(encode(target))
)lua";

std::string trim_copy(std::string_view s) {
    const auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && is_ws(s[b])) {
        b++;
    }
    while (e > b && is_ws(s[e - 1])) {
        e--;
    }
    return std::string(s.substr(b, e - b));
}

bool has_path_separator(const fs::path& p) {
    return p.has_parent_path();
}

void raise_if_not_launched(const proc::ProcessResult& res, std::string_view tool) {
    if (!res.launched) {
        throw RuntimeUnavailable(std::string(tool) + " could not be started: " + res.launch_error);
    }
    if (res.exit_code == kCommandNotFoundExit) {
        throw RuntimeUnavailable(
            std::string(tool) + " not found (exit code 127): " + trim_copy(res.err)
        );
    }
}
}  // namespace

std::string_view table_dump_script() {
    return kTableDumpScript;
}

LuaValue parse_table_dump(std::string_view output) {
    const std::string text = trim_copy(output);
    if (text.empty()) {
        return LuaValue::object();
    }
    try {
        return LuaValue::parse(text);
    } catch (const nlohmann::ordered_json::parse_error& ex) {
        throw ToolFailure(std::string("Lua table dump produced invalid JSON: ") + ex.what());
    }
}

ProcessTools::ProcessTools(ProcessToolsOptions opt) : _opt(std::move(opt)) {}

void ProcessTools::reset_resolved_paths() {
    _jar_path.reset();
    _lua_path.reset();
}

std::vector<std::string> ProcessTools::decompiler_argv() {
    if (!_opt.decompiler_command.empty()) {
        return _opt.decompiler_command;
    }
    const fs::path jar = _jar_path.get([this] {
        return _opt.decompiler_jar.has_value() ? *_opt.decompiler_jar
                                               : fs_utils::executable_dir() / "unluac.jar";
    });
    std::error_code ec;
    if (!fs::exists(jar, ec) || ec) {
        throw RuntimeUnavailable(
            "unluac jar missing at " + jar.string()
            + ". Build it from https://github.com/viruscamp/unluac and place it there."
        );
    }
    return {_opt.java_executable, "-jar", jar.string()};
}

fs::path ProcessTools::lua_path() {
    return _lua_path.get([this] {
        return _opt.lua_executable.has_value() ? *_opt.lua_executable : fs::path("lua5.3");
    });
}

std::string ProcessTools::decompile(std::span<const std::uint8_t> chunk) {
    auto argv = decompiler_argv();

    fs_utils::ScopedTempDir tmp("romc_unluac_");
    const fs::path chunk_path = tmp.path() / "chunk.luac";
    fs_utils::write_file(chunk_path, chunk);
    argv.push_back(chunk_path.string());

    const auto t0 = std::chrono::steady_clock::now();
    const auto res = proc::run_process(argv);
    const auto t1 = std::chrono::steady_clock::now();
    if (_opt.debug) {
        ROMC_LOG_INFO(
            "Decompiler %s: exit=%d stdout=%zu bytes %lldms", argv.front().c_str(), res.exit_code,
            res.out.size(),
            static_cast<long long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count()
            )
        );
    }

    raise_if_not_launched(res, "Decompiler '" + argv.front() + "'");
    if (res.exit_code != 0) {
        throw ToolFailure(
            "unluac failed (code " + std::to_string(res.exit_code) + "): " + trim_copy(res.err)
        );
    }
    return res.out;
}

LuaValue ProcessTools::dump_table(std::span<const std::uint8_t> chunk, std::string_view table_name) {
    const fs::path lua = lua_path();
    if (has_path_separator(lua)) {
        std::error_code ec;
        if (!fs::exists(lua, ec) || ec) {
            throw RuntimeUnavailable(
                "Lua interpreter not found at " + lua.string()
                + ". Build Lua 5.3.x (32-bit) and set ROMC_LUA_PATH."
            );
        }
    }

    fs_utils::ScopedTempDir tmp("romc_lua_");
    const fs::path chunk_path = tmp.path() / "chunk.luac";
    const fs::path script_path = tmp.path() / "dump.lua";
    fs_utils::write_file(chunk_path, chunk);
    fs_utils::write_text_file(script_path, std::string(kTableDumpScript));

    const std::vector<std::string> argv = {
        lua.string(), script_path.string(), chunk_path.string(), std::string(table_name)
    };
    const auto res = proc::run_process(argv);
    if (_opt.debug) {
        ROMC_LOG_INFO(
            "Lua dump '%s': exit=%d stdout=%zu bytes", std::string(table_name).c_str(),
            res.exit_code, res.out.size()
        );
    }

    raise_if_not_launched(res, "Lua interpreter '" + lua.string() + "'");
    if (res.exit_code == kTableMissingExit) {
        throw RuntimeFault(trim_copy(res.err));
    }
    if (res.exit_code != 0) {
        throw ToolFailure(
            "Lua execution failed (code " + std::to_string(res.exit_code)
            + "): " + trim_copy(res.err)
        );
    }
    return parse_table_dump(res.out);
}
}  // namespace romc::script
