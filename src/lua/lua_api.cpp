/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "lua/lua_api.h"
#include "utils/fs_utils.h"

#include <stdexcept>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

namespace fs = std::filesystem;

namespace romc::lua {
#if defined(_WIN32)
static void* load_library_handle(const fs::path& p) {
    const std::wstring w = p.wstring();
    HMODULE m = ::LoadLibraryW(w.c_str());
    return reinterpret_cast<void*>(m);
}

static void unload_library_handle(void* h) {
    if (!h) {
        return;
    }
    ::FreeLibrary(reinterpret_cast<HMODULE>(h));
}

static void* get_export(void* h, const char* name) {
    if (!h) {
        return nullptr;
    }
    FARPROC p = ::GetProcAddress(reinterpret_cast<HMODULE>(h), name);
    return reinterpret_cast<void*>(p);
}

static std::string last_load_error() {
    return "error " + std::to_string(::GetLastError());
}
#else
static void* load_library_handle(const fs::path& p) {
    return ::dlopen(p.string().c_str(), RTLD_NOW | RTLD_LOCAL);
}

static void unload_library_handle(void* h) {
    if (!h) {
        return;
    }
    ::dlclose(h);
}

static void* get_export(void* h, const char* name) {
    if (!h) {
        return nullptr;
    }
    return ::dlsym(h, name);
}

static std::string last_load_error() {
    const char* err = ::dlerror();
    return err ? std::string(err) : std::string("unknown dlopen error");
}
#endif

template <typename Fn>
static void require_export(void* h, const char* name, Fn& out) {
    void* p = get_export(h, name);
    if (!p) {
        throw std::runtime_error(std::string("Missing Lua export: ") + name);
    }
    out = reinterpret_cast<Fn>(p);
}

template <typename Fn>
static bool optional_export(void* h, const char* name, Fn& out) {
    void* p = get_export(h, name);
    out = reinterpret_cast<Fn>(p);
    return p != nullptr;
}

fs::path LuaApi::default_library_path() {
    const fs::path exedir = fs_utils::executable_dir();
#if defined(_WIN32)
    return exedir / "slua_encrypt.dll";
#else
    return exedir / "libslua.so";
#endif
}

std::unique_ptr<LuaApi> LuaApi::load(const fs::path& lib_path) {
    void* h = load_library_handle(lib_path);
    if (!h) {
        throw std::runtime_error(
            "Failed to load Lua library " + lib_path.string() + ": " + last_load_error()
        );
    }
    std::unique_ptr<LuaApi> api(new LuaApi(h));
    // From here on api's destructor releases the handle if an export is missing.
    require_export(h, "luaL_newstate", api->newstate);
    require_export(h, "lua_close", api->close);
    require_export(h, "luaL_openlibs", api->openlibs);
    api->_has_rom_loader = optional_export(h, "luaRO_loadbufferx", api->loadbufferx);
    if (!api->_has_rom_loader) {
        require_export(h, "luaL_loadbufferx", api->loadbufferx);
    }
    require_export(h, "lua_dump", api->dump);
    require_export(h, "lua_pcallk", api->pcallk);
    require_export(h, "lua_getglobal", api->getglobal);
    require_export(h, "lua_type", api->type);
    require_export(h, "lua_next", api->next);
    require_export(h, "lua_pushnil", api->pushnil);
    require_export(h, "lua_gettop", api->gettop);
    require_export(h, "lua_checkstack", api->checkstack);
    require_export(h, "lua_settop", api->settop);
    require_export(h, "lua_tointegerx", api->tointegerx);
    require_export(h, "lua_tonumberx", api->tonumberx);
    require_export(h, "lua_tolstring", api->tolstring);
    require_export(h, "lua_toboolean", api->toboolean);
    require_export(h, "lua_isinteger", api->isinteger);
    require_export(h, "lua_topointer", api->topointer);
    return api;
}

std::unique_ptr<LuaApi> LuaApi::unbound() {
    return std::unique_ptr<LuaApi>(new LuaApi(nullptr));
}

LuaApi::~LuaApi() {
    unload_library_handle(_handle);
    _handle = nullptr;
}
}  // namespace romc::lua
