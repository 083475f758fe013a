/**
 * @file Application.hpp
 * @brief Command-line front end: manifest in, composed recording out.
 *
 * Owns the QCoreApplication (required by the HTTP voice-conversion client
 * and the media fetcher), the logger and the configuration, then runs one
 * export synchronously and writes the result into the configured output
 * directory, or the working directory when none is set.
 *
 * @section Dependencies
 * - Qt Core (QCoreApplication, QCommandLineParser)
 * - ExportEngine, ManifestLoader
 */

#pragma once
#include <QCoreApplication>
#include <atomic>
#include <memory>
#include <optional>
#include "core/ConfigData.hpp"
#include "export/ExportTypes.hpp"
#include "util/Result.hpp"

namespace rs {

class ExportEngine;

struct AppOptions {
    fs::path manifestPath;
    std::optional<fs::path> backdropPath;
    std::optional<fs::path> outputDir;
    std::optional<fs::path> configPath;
    std::optional<bool> normalize; // unset keeps the configured value
    bool offline{false};           // ImmediateFrameClock instead of real time
    bool debug{false};
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    Result<AppOptions> parseArgs();
    Result<void> init(const AppOptions& opts);

    // Runs the export; returns the process exit code
    int exec();

    // Lets the running export finish its segment, then cancel (SIGINT)
    void requestStop();

private:
    Result<ExportRequest> buildRequest() const;
    Result<fs::path> writeOutput(const CaptureOutput& output) const;

    std::unique_ptr<QCoreApplication> qapp_;
    AppOptions opts_;
    std::atomic<ExportEngine*> engine_{nullptr};
};

} // namespace rs
