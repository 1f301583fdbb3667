/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    std::optional<std::string> table_name;
    bool records = false;
    bool debug = false;
    std::optional<fs::path> companion_path;
    romc::DecoderConfig config;
};

static void print_usage() {
    ROMC_LOG_INFO(
        "Usage:\n" \
        "    romc_decoder <file-or-dir> [--table NAME] [--records] [--companion PATH] [--runtime PATH] [--unluac PATH] [--lua PATH] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory\n" \
        "    --table NAME      runs the script and writes global table NAME as .json\n" \
        "    --records         writes every {id=...} record found in the decoded text as .json\n" \
        "    --companion PATH  secondary raw copy of the asset (single file input only)\n" \
        "    --runtime PATH    Lua shared library with luaRO_loadbufferx (env SLUA_LIB)\n" \
        "    --unluac PATH     unluac jar (env ROMC_UNLUAC_JAR)\n" \
        "    --lua PATH        Lua 5.3 interpreter (env ROMC_LUA_PATH)\n" \
        "    --debug           enables extra logging\n"
    );
}

static std::string dump_json(const nlohmann::ordered_json& j) {
    return j.dump(2, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

// Text assets exported as UTF-16LE start with a byte order mark.
static std::optional<std::u16string> utf16le_text(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 2 || bytes.size() % 2 != 0 || bytes[0] != 0xFF || bytes[1] != 0xFE) {
        return std::nullopt;
    }
    std::u16string out;
    out.reserve(bytes.size() / 2 - 1);
    for (std::size_t i = 2; i < bytes.size(); i += 2) {
        out.push_back(static_cast<char16_t>(bytes[i] | (bytes[i + 1] << 8)));
    }
    return out;
}

static void process_file(
    const romc::ScriptDecoder& decoder,
    const fs::path& path,
    const fs::path& out_root,
    const fs::path& base_dir,
    const Settings& settings
) {
    const std::string base = path.stem().string();
    const std::string label = romc::fs_utils::display_path(path, base_dir);
    try {
        const auto t0 = std::chrono::steady_clock::now();
        const auto bytes = romc::fs_utils::read_file(path);
        std::vector<std::uint8_t> companion;
        if (settings.companion_path.has_value()) {
            companion = romc::fs_utils::read_file(*settings.companion_path);
        }
        if (bytes.empty()) {
            ROMC_LOG_INFO("Skipped: %s (empty file)", label.c_str());
            return;
        }

        const auto text16 = utf16le_text(bytes);
        fs::path out_path;
        if (settings.table_name.has_value()) {
            const auto snap = decoder.snapshot(bytes, *settings.table_name);
            const fs::path out_dir = out_root / "json";
            romc::fs_utils::ensure_dir(out_dir);
            out_path = out_dir / (base + std::string(".json"));
            romc::fs_utils::write_text_file(out_path, dump_json(snap.value));
        } else if (settings.records) {
            const auto records = text16.has_value() ? decoder.parse_records(*text16, companion)
                                                    : decoder.parse_records(bytes, companion);
            const fs::path out_dir = out_root / "records";
            romc::fs_utils::ensure_dir(out_dir);
            out_path = out_dir / (base + std::string(".json"));
            nlohmann::ordered_json arr = nlohmann::ordered_json::array();
            for (const auto& r : records) {
                arr.push_back(r);
            }
            romc::fs_utils::write_text_file(out_path, dump_json(arr));
            if (settings.debug) {
                ROMC_LOG_INFO("Records %s: %zu", label.c_str(), records.size());
            }
        } else {
            const auto text = text16.has_value() ? decoder.text_from_asset(*text16, companion)
                                                 : decoder.decode_to_text(bytes, companion);
            const fs::path out_dir = out_root / "lua";
            romc::fs_utils::ensure_dir(out_dir);
            out_path = out_dir / (base + std::string(".lua"));
            romc::fs_utils::write_text_file(out_path, text);
        }

        if (settings.debug) {
            const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - t0
            )
                                .count();
            ROMC_LOG_INFO("Processed %s in %lldms", label.c_str(), static_cast<long long>(ms));
        }
        ROMC_LOG_INFO("Wrote: %s", out_path.string().c_str());
    } catch (const std::exception& e) {
        ROMC_LOG_ERROR("Failed: %s (%s)", label.c_str(), e.what());
    }
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        ROMC_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--records") {
            settings.records = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--table" || arg == "--companion" || arg == "--runtime" || arg == "--unluac"
            || arg == "--lua") {
            if (i + 1 >= argc) {
                ROMC_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
                return 2;
            }
            const std::string value = argv[++i];
            if (arg == "--table") {
                settings.table_name = value;
            } else if (arg == "--companion") {
                settings.companion_path = fs::path(value);
            } else if (arg == "--runtime") {
                settings.config.runtime_library = fs::path(value);
            } else if (arg == "--unluac") {
                settings.config.decompiler_jar = fs::path(value);
            } else {
                settings.config.lua_executable = fs::path(value);
            }
            continue;
        }
        ROMC_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (settings.table_name.has_value() && settings.records) {
        ROMC_LOG_ERROR("--table and --records are mutually exclusive.");
        return 2;
    }
    if (!fs::exists(input)) {
        ROMC_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }
    if (settings.companion_path.has_value() && fs::is_directory(input)) {
        ROMC_LOG_ERROR("--companion requires a single input file.");
        return 2;
    }

    settings.config.debug = settings.debug;
    const romc::ScriptDecoder decoder(romc::DecoderConfig::from_environment(settings.config));

    const fs::path exe_dir = romc::fs_utils::executable_dir();
    const fs::path out_root = exe_dir / "output";
    romc::fs_utils::ensure_dir(out_root);

    if (fs::is_directory(input)) {
        const auto inputs = romc::fs_utils::collect_inputs(input);
        for (const auto& p : inputs) {
            process_file(decoder, p, out_root, input, settings);
        }
        return 0;
    }

    process_file(decoder, input, out_root, input.parent_path(), settings);
    return 0;
}
