#include "ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace rs {

std::vector<fs::path> ConfigLoader::shippedDefaults() {
    std::vector<fs::path> paths;
    if (const char* dir = std::getenv("REELSYNC_DATA_DIR"); dir && *dir) {
        paths.emplace_back(fs::path(dir) / "config" / "default.toml");
    }
    paths.push_back(file::dataDir() / "config" / "default.toml");
    paths.emplace_back("/usr/local/share/reelsync/config/default.toml");
    paths.emplace_back("/usr/share/reelsync/config/default.toml");
    return paths;
}

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<void>::err(ErrorCode::InvalidInput,
                                 "Config file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());

        config.debug_ = tbl["general"]["debug"].value_or(false);
        ConfigParsers::parseExport(tbl, config.export_);
        ConfigParsers::parseCapture(tbl, config.capture_);
        ConfigParsers::parseNormalization(tbl, config.normalization_);

        config.markClean();
        LOG_INFO("Config loaded from: {} ({} codec candidates)",
                 path.string(),
                 config.capture_.candidates.size());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(ErrorCode::InvalidInput,
                                 std::string("Config parse error in ") +
                                         path.string() + ": " +
                                         std::string(err.description()));
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto configDir = file::configDir();
    auto userPath = configDir / "config.toml";
    config.configPath_ = userPath;

    if (fs::exists(userPath)) {
        return load(config, userPath);
    }

    file::ensureDir(configDir);
    for (const auto& shipped : shippedDefaults()) {
        if (!fs::exists(shipped)) {
            continue;
        }
        std::error_code ec;
        fs::copy_file(shipped, userPath, ec);
        if (ec) {
            LOG_WARN("Could not copy {}: {}", shipped.string(), ec.message());
            return load(config, shipped);
        }
        LOG_INFO("Installed default config from {}", shipped.string());
        return load(config, userPath);
    }

    LOG_WARN("No shipped default.toml found, writing built-in defaults");
    if (auto res = save(config, userPath); !res) {
        LOG_WARN("Could not write default config: {}", res.error().message);
    }
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.export_,
                                        config.capture_,
                                        config.normalization_,
                                        config.debug_);
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath, std::ios::trunc);
        if (!out) {
            return Result<void>::err(ErrorCode::InvalidInput,
                                     "Cannot write " + tempPath.string());
        }
        out << tbl;
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        fs::remove(tempPath, ec);
        LOG_ERROR("Failed to save config to {}", path.string());
        return Result<void>::err(ErrorCode::InvalidInput,
                                 "Failed to save config: " + path.string());
    }
    LOG_DEBUG("Config saved to: {}", path.string());
    return Result<void>::ok();
}

} // namespace rs
