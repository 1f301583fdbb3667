/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_runtime.h"
#include "lua/lua_api.h"
#include "script/script_chunk.h"
#include "script/script_errors.h"
#include "utils/log.h"

#include <cmath>
#include <new>
#include <unordered_set>

namespace fs = std::filesystem;

namespace romc::script {
namespace {
constexpr const char* kChunkName = "romc";

// Tables currently being expanded on the path from the root; used to cut cycles.
using VisitSet = std::unordered_set<const void*>;

LuaValue to_value(const lua::LuaApi& api, lua::State* L, int idx, VisitSet& visiting);

LuaValue table_to_value(const lua::LuaApi& api, lua::State* L, int idx, VisitSet& visiting) {
    const int abs_idx = api.abs_index(L, idx);
    const void* ident = api.topointer(L, abs_idx);
    if (ident && !visiting.insert(ident).second) {
        return nullptr;
    }
    if (!api.checkstack(L, 3)) {
        throw RuntimeFault("Lua stack exhausted while marshalling nested tables");
    }

    TableBuilder builder;
    api.pushnil(L);
    while (api.next(L, abs_idx) != 0) {
        LuaValue value = to_value(api, L, -1, visiting);
        if (value.is_number_float() && !std::isfinite(value.get<double>())) {
            value = nullptr;
        }
        const LuaValue key = to_value(api, L, -2, visiting);
        api.pop(L, 1);
        builder.add(key, std::move(value));
    }

    if (ident) {
        visiting.erase(ident);
    }
    return std::move(builder).build();
}

LuaValue to_value(const lua::LuaApi& api, lua::State* L, int idx, VisitSet& visiting) {
    switch (api.type(L, idx)) {
        case lua::LUA_TBOOLEAN:
            return api.toboolean(L, idx) != 0;
        case lua::LUA_TNUMBER:
            if (api.isinteger(L, idx)) {
                return static_cast<std::int64_t>(api.tointegerx(L, idx, nullptr));
            }
            return static_cast<double>(api.tonumberx(L, idx, nullptr));
        case lua::LUA_TSTRING: {
            std::size_t len = 0;
            const char* p = api.tolstring(L, idx, &len);
            return p ? std::string(p, len) : std::string();
        }
        case lua::LUA_TTABLE:
            return table_to_value(api, L, idx, visiting);
        default:
            return nullptr;
    }
}

std::string stack_error(const lua::LuaApi& api, lua::State* L, std::string_view fallback) {
    std::string msg(fallback);
    if (api.type(L, -1) == lua::LUA_TSTRING) {
        std::size_t len = 0;
        const char* p = api.tolstring(L, -1, &len);
        if (p) {
            msg.assign(p, len);
        }
    }
    api.pop(L, 1);
    return msg;
}

int append_writer(lua::State*, const void* p, std::size_t sz, void* ud) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(ud);
    const auto* bytes = static_cast<const std::uint8_t*>(p);
    try {
        out->insert(out->end(), bytes, bytes + sz);
    } catch (const std::bad_alloc&) {
        return 1;
    }
    return 0;
}

lua::State* open_state(const lua::LuaApi& api) {
    lua::State* L = api.newstate();
    if (!L) {
        throw RuntimeFault("Failed to create Lua state");
    }
    return L;
}

void load_chunk(const lua::LuaApi& api, lua::State* L, std::span<const std::uint8_t> blob) {
    if (!api.has_rom_loader() && has_script_marker(blob)) {
        throw RuntimeUnavailable("Lua library has no luaRO_loadbufferx; cannot load encoded chunk");
    }
    api.openlibs(L);
    const int rc = api.loadbufferx(
        L, reinterpret_cast<const char*>(blob.data()), blob.size(), kChunkName, nullptr
    );
    if (rc != lua::LUA_OK) {
        throw RuntimeFault(
            "Lua load failed with code " + std::to_string(rc) + ": "
            + stack_error(api, L, "no message")
        );
    }
}
}  // namespace

NativeRuntime::NativeRuntime(std::optional<fs::path> library_path)
    : _configured_path(std::move(library_path)) {}

NativeRuntime::~NativeRuntime() = default;

fs::path NativeRuntime::library_path() {
    return _resolved_path.get([this] {
        return _configured_path.has_value() ? *_configured_path : lua::LuaApi::default_library_path();
    });
}

void NativeRuntime::reset() {
    std::lock_guard<std::mutex> lock(_mutex);
    _api.reset();
    _load_error.reset();
    _resolved_path.reset();
}

std::shared_ptr<const lua::LuaApi> NativeRuntime::api() {
    const fs::path path = library_path();
    std::lock_guard<std::mutex> lock(_mutex);
    if (_api) {
        return _api;
    }
    if (_load_error.has_value()) {
        throw RuntimeUnavailable(*_load_error);
    }

    std::error_code ec;
    if (!fs::exists(path, ec) || ec) {
        _load_error = "Lua runtime library not found at " + path.string();
        throw RuntimeUnavailable(*_load_error);
    }
    try {
        _api = lua::LuaApi::load(path);
    } catch (const std::exception& ex) {
        _load_error = ex.what();
        ROMC_LOG_WARN("Failed to load Lua runtime from %s: %s", path.string().c_str(), ex.what());
        throw RuntimeUnavailable(*_load_error);
    }
    return _api;
}

std::vector<std::uint8_t> NativeRuntime::compile(std::span<const std::uint8_t> blob) {
    if (blob.empty()) {
        return {};
    }
    const auto lib = api();
    lua::StateGuard state(*lib, open_state(*lib));
    load_chunk(*lib, state.get(), blob);

    std::vector<std::uint8_t> out;
    const int rc = lib->dump(state.get(), &append_writer, &out, 0);
    if (rc != 0) {
        throw RuntimeFault("lua_dump failed with code " + std::to_string(rc));
    }
    return out;
}

LuaValue NativeRuntime::run_and_extract(
    std::span<const std::uint8_t> blob,
    std::string_view table_name
) {
    if (blob.empty()) {
        return LuaValue::object();
    }
    const auto lib = api();
    lua::StateGuard state(*lib, open_state(*lib));
    lua::State* L = state.get();
    load_chunk(*lib, L, blob);

    if (lib->pcallk(L, 0, 0, 0, 0, nullptr) != lua::LUA_OK) {
        throw RuntimeFault(stack_error(*lib, L, "lua runtime error"));
    }
    const std::string name(table_name);
    lib->getglobal(L, name.c_str());
    if (lib->type(L, -1) != lua::LUA_TTABLE) {
        throw RuntimeFault("table '" + name + "' not found");
    }

    return marshal_table(*lib, L, -1);
}

LuaValue marshal_table(const lua::LuaApi& api, lua::State* L, int idx) {
    VisitSet visiting;
    return table_to_value(api, L, idx, visiting);
}

UnavailableRuntime::UnavailableRuntime(std::string reason) : _reason(std::move(reason)) {}

std::vector<std::uint8_t> UnavailableRuntime::compile(std::span<const std::uint8_t>) {
    throw RuntimeUnavailable(_reason);
}

LuaValue UnavailableRuntime::run_and_extract(std::span<const std::uint8_t>, std::string_view) {
    throw RuntimeUnavailable(_reason);
}
}  // namespace romc::script
