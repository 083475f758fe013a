/**
 * @file ConfigLoader.hpp
 * @brief Reads and writes config.toml.
 *
 * The user file lives in file::configDir(). When it is missing, the first
 * shipped default.toml found on the search path is copied there; with no
 * shipped file at all the built-in values are written out instead.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "util/Result.hpp"

namespace rs {

class Config;

class ConfigLoader {
public:
    static Result<void> load(Config& config, const std::filesystem::path& path);
    static Result<void> save(const Config& config,
                             const std::filesystem::path& path);
    static Result<void> loadDefault(Config& config);

    // $REELSYNC_DATA_DIR, the user data dir, then the install prefixes
    static std::vector<std::filesystem::path> shippedDefaults();
};

} // namespace rs
