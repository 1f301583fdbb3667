/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include "log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace romc::fs_utils {
static const std::array<std::string_view, 4> kScriptExtensions = {".bytes", ".lua", ".luac", ".txt"};

bool is_script_input(const fs::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return std::find(kScriptExtensions.begin(), kScriptExtensions.end(), ext)
           != kScriptExtensions.end();
}

fs::path executable_dir() {
#if defined(_WIN32)
    std::wstring buf(32768, L'\0');
    const DWORD n = ::GetModuleFileNameW(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n == 0 || n >= buf.size()) {
        return fs::current_path();
    }
    buf.resize(n);
    return fs::path(buf).parent_path();
#else
    std::error_code ec;
    const fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return fs::current_path();
    }
    return exe.parent_path();
#endif
}

std::vector<fs::path> collect_inputs(const fs::path& root) {
    std::vector<fs::path> out;
    const auto opts = fs::directory_options::skip_permission_denied;
    for (const auto& entry : fs::recursive_directory_iterator(root, opts)) {
        if (entry.is_regular_file() && is_script_input(entry.path())) {
            out.push_back(entry.path());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::uint8_t> read_file(const fs::path& path) {
    std::error_code ec;
    const auto len = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Failed to stat " + path.string() + ": " + ec.message());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Failed to open file for reading: " + path.string());
    }
    std::vector<std::uint8_t> buf(static_cast<std::size_t>(len));
    if (!buf.empty()
        && !f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()))) {
        throw std::runtime_error("Short read: " + path.string());
    }
    return buf;
}

void write_text_file(const fs::path& path, const std::string& text) {
    write_file(
        path, std::span<const std::uint8_t>(
                  reinterpret_cast<const std::uint8_t*>(text.data()), text.size()
              )
    );
}

void write_file(const fs::path& path, std::span<const std::uint8_t> bytes) {
    ensure_dir(path.parent_path());
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f.flush()) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }
}

void ensure_dir(const fs::path& dir) {
    if (dir.empty()) {
        return;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create directory " + dir.string() + ": " + ec.message());
    }
}

static fs::path canonical_or_self(const fs::path& p) {
    std::error_code ec;
    fs::path out = fs::weakly_canonical(p, ec);
    return ec ? p : out;
}

// Path relative to base_dir for log lines; absolute when it lies outside base_dir.
std::string display_path(const fs::path& path, const fs::path& base_dir) {
    if (base_dir.empty()) {
        return path.string();
    }
    const fs::path abs_path = canonical_or_self(path);
    const fs::path rel = abs_path.lexically_relative(canonical_or_self(base_dir));
    if (rel.empty() || rel == "." || *rel.begin() == "..") {
        return abs_path.string();
    }
    return rel.string();
}

static std::string random_suffix() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<std::uint32_t> dis(0, 0xFFFFFFu);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%06x", dis(gen));
    return buf;
}

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
    const fs::path tmp = fs::temp_directory_path();
    for (int attempt = 0; attempt < 16; attempt++) {
        fs::path cand = tmp / (std::string(prefix) + random_suffix());
        std::error_code ec;
        if (fs::create_directory(cand, ec) && !ec) {
            _path = std::move(cand);
            return;
        }
    }
    throw std::runtime_error(
        std::string("Failed to create temporary directory under ") + tmp.string()
    );
}

ScopedTempDir::~ScopedTempDir() {
    if (_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(_path, ec);
    if (ec) {
        ROMC_LOG_WARN(
            "Could not remove temporary directory %s: %s", _path.string().c_str(),
            ec.message().c_str()
        );
    }
}
}  // namespace romc::fs_utils
