/**
 * @file Config.hpp
 * @brief Configuration management singleton.
 *
 * Thread-safe singleton holding the application settings. Parsing is
 * delegated to ConfigParsers and file I/O to ConfigLoader. The export engine
 * never reads the singleton directly; callers copy the sections they need
 * into ExportSettings so that one export cannot observe another's changes.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 * - ConfigParsers
 */

#pragma once
#include <mutex>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace rs {

class Config {
public:
    static Config& instance();

    Result<void> load(const fs::path& path);
    Result<void> save(const fs::path& path) const;
    Result<void> loadDefault();

    // RVC_API_URL / RVC_MODEL_NAME / RVC_F0_METHOD / RVC_INDEX_RATE
    void applyEnvironment();

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
        markDirty();
    }

    const ExportConfig& exporting() const {
        return export_;
    }
    const CaptureConfig& capture() const {
        return capture_;
    }
    const NormalizationConfig& normalization() const {
        return normalization_;
    }

    ExportConfig& exporting() {
        markDirty();
        return export_;
    }
    CaptureConfig& capture() {
        markDirty();
        return capture_;
    }
    NormalizationConfig& normalization() {
        markDirty();
        return normalization_;
    }

    bool isDirty() const {
        return dirty_;
    }
    void markClean() {
        dirty_ = false;
    }

private:
    friend class ConfigLoader;

    Config() = default;
    void markDirty() {
        dirty_ = true;
    }

    fs::path configPath_;
    bool dirty_{false};
    bool debug_{false};

    ExportConfig export_;
    CaptureConfig capture_;
    NormalizationConfig normalization_;

    mutable std::mutex mutex_;
};

#define CONFIG rs::Config::instance()

} // namespace rs
