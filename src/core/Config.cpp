#include "Config.hpp"
#include <cstdlib>
#include "ConfigLoader.hpp"
#include "Logger.hpp"

namespace rs {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<void> Config::load(const fs::path& path) {
    std::lock_guard lock(mutex_);
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    std::lock_guard lock(mutex_);
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    std::lock_guard lock(mutex_);
    return ConfigLoader::save(*this, path);
}

void Config::applyEnvironment() {
    std::lock_guard lock(mutex_);

    auto env = [](const char* name) -> std::string {
        const char* v = std::getenv(name);
        return v ? std::string(v) : std::string();
    };

    auto url = env("RVC_API_URL");
    auto model = env("RVC_MODEL_NAME");
    if (url.empty() || model.empty()) {
        return;
    }

    normalization_.enabled = true;
    normalization_.apiUrl = url;
    normalization_.modelName = model;
    if (auto f0 = env("RVC_F0_METHOD"); !f0.empty()) {
        normalization_.f0Method = f0;
    }
    if (auto rate = env("RVC_INDEX_RATE"); !rate.empty()) {
        char* end = nullptr;
        double v = std::strtod(rate.c_str(), &end);
        if (end != rate.c_str() && v >= 0.0 && v <= 1.0) {
            normalization_.indexRate = v;
        } else {
            LOG_WARN("Ignoring RVC_INDEX_RATE={} (expected 0..1)", rate);
        }
    }
    markDirty();
    LOG_INFO("Voice normalization enabled from environment: {} model={}",
             url,
             model);
}

} // namespace rs
