/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace romc::lua {
// Opaque interpreter state (lua_State*).
struct State;

constexpr int LUA_OK = 0;
constexpr int LUA_TNONE = -1;
constexpr int LUA_TNIL = 0;
constexpr int LUA_TBOOLEAN = 1;
constexpr int LUA_TLIGHTUSERDATA = 2;
constexpr int LUA_TNUMBER = 3;
constexpr int LUA_TSTRING = 4;
constexpr int LUA_TTABLE = 5;
constexpr int LUA_TFUNCTION = 6;
constexpr int LUA_REGISTRYINDEX = -1001000;

using lua_Integer = long long;
using lua_Number = double;
using lua_KContext = std::intptr_t;
using lua_Writer = int (*)(State* L, const void* p, std::size_t sz, void* ud);
using lua_KFunction = int (*)(State* L, int status, lua_KContext ctx);

/**
 * Lua 5.3 C API resolved from a shared library at runtime. The game ships its own build
 * whose loader export is luaRO_loadbufferx (it undoes the chunk obfuscation on load); a stock
 * liblua only has luaL_loadbufferx, which is used when the former is missing.
 */
class LuaApi {
   public:
    static std::filesystem::path default_library_path();
    static std::unique_ptr<LuaApi> load(const std::filesystem::path& lib_path);
    // No library behind it; every entry point is left for the caller to bind.
    static std::unique_ptr<LuaApi> unbound();

    ~LuaApi();

    LuaApi(const LuaApi&) = delete;
    LuaApi& operator=(const LuaApi&) = delete;

    bool has_rom_loader() const { return _has_rom_loader; }

    State* (*newstate)() = nullptr;
    void (*close)(State* L) = nullptr;
    void (*openlibs)(State* L) = nullptr;
    int (*loadbufferx)(
        State* L, const char* buff, std::size_t sz, const char* name, const char* mode
    ) = nullptr;
    int (*dump)(State* L, lua_Writer writer, void* data, int strip) = nullptr;
    int (*pcallk)(
        State* L, int nargs, int nresults, int errfunc, lua_KContext ctx, lua_KFunction k
    ) = nullptr;
    int (*getglobal)(State* L, const char* name) = nullptr;
    int (*type)(State* L, int idx) = nullptr;
    int (*next)(State* L, int idx) = nullptr;
    void (*pushnil)(State* L) = nullptr;
    int (*gettop)(State* L) = nullptr;
    int (*checkstack)(State* L, int n) = nullptr;
    void (*settop)(State* L, int idx) = nullptr;
    lua_Integer (*tointegerx)(State* L, int idx, int* isnum) = nullptr;
    lua_Number (*tonumberx)(State* L, int idx, int* isnum) = nullptr;
    const char* (*tolstring)(State* L, int idx, std::size_t* len) = nullptr;
    int (*toboolean)(State* L, int idx) = nullptr;
    int (*isinteger)(State* L, int idx) = nullptr;
    const void* (*topointer)(State* L, int idx) = nullptr;

    void pop(State* L, int n) const { settop(L, -n - 1); }
    int abs_index(State* L, int idx) const {
        return (idx > 0 || idx <= LUA_REGISTRYINDEX) ? idx : gettop(L) + idx + 1;
    }

   private:
    explicit LuaApi(void* handle) : _handle(handle) {}

    void* _handle = nullptr;
    bool _has_rom_loader = false;
};

// Owns one interpreter state for the duration of a call.
class StateGuard {
   public:
    StateGuard(const LuaApi& api, State* state) : _api(api), _state(state) {}
    ~StateGuard() {
        if (_state) {
            _api.close(_state);
        }
    }

    StateGuard(const StateGuard&) = delete;
    StateGuard& operator=(const StateGuard&) = delete;

    State* get() const { return _state; }

   private:
    const LuaApi& _api;
    State* _state;
};
}  // namespace romc::lua
