/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

namespace romc::utils {
// Lazily resolved path. The resolver runs once; later calls return the cached value until
// reset() is called.
class ResolvedPath {
   public:
    std::filesystem::path get(const std::function<std::filesystem::path()>& resolve) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_value.has_value()) {
            _value = resolve();
        }
        return *_value;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(_mutex);
        _value.reset();
    }

   private:
    std::mutex _mutex;
    std::optional<std::filesystem::path> _value;
};
}  // namespace romc::utils
