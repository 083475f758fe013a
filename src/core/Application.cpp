#include "Application.hpp"
#include <QCommandLineParser>
#include <chrono>
#include <iostream>
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "export/ExportEngine.hpp"
#include "export/ManifestLoader.hpp"
#include "util/FileUtils.hpp"

namespace rs {

Application::Application(int& argc, char** argv)
    : qapp_(std::make_unique<QCoreApplication>(argc, argv)) {
    QCoreApplication::setApplicationName("reelsync");
    QCoreApplication::setApplicationVersion("0.1.0");
}

Application::~Application() {
    Logger::shutdown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    parser.setApplicationDescription(
            "Compose rehearsal segments (speech, gesture video, backdrop) "
            "into one synchronized recording");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption manifestOpt(
            {"m", "manifest"}, "Segment manifest (TOML)", "file");
    QCommandLineOption backdropOpt(
            {"b", "backdrop"}, "Backdrop image, overrides the manifest", "file");
    QCommandLineOption outputOpt(
            {"o", "output"}, "Directory the recording is written to", "dir");
    QCommandLineOption configOpt(
            {"c", "config"}, "Configuration file", "file");
    QCommandLineOption normalizeOpt(
            "normalize", "Convert every speech clip to the configured voice");
    QCommandLineOption noNormalizeOpt(
            "no-normalize", "Skip voice normalization");
    QCommandLineOption offlineOpt(
            "offline", "Render as fast as possible instead of in real time");
    QCommandLineOption debugOpt({"d", "debug"}, "Enable debug logging");

    parser.addOptions({manifestOpt,
                       backdropOpt,
                       outputOpt,
                       configOpt,
                       normalizeOpt,
                       noNormalizeOpt,
                       offlineOpt,
                       debugOpt});
    parser.addPositionalArgument("manifest", "Segment manifest (TOML)", "[manifest]");

    parser.process(*qapp_);

    AppOptions opts;
    if (parser.isSet(manifestOpt)) {
        opts.manifestPath = file::expandHome(parser.value(manifestOpt).toStdString());
    } else if (!parser.positionalArguments().isEmpty()) {
        opts.manifestPath = file::expandHome(parser.positionalArguments().first().toStdString());
    } else {
        return Result<AppOptions>::err(ErrorCode::InvalidInput, "No manifest given");
    }

    if (parser.isSet(backdropOpt)) {
        opts.backdropPath = file::expandHome(parser.value(backdropOpt).toStdString());
    }
    if (parser.isSet(outputOpt)) {
        opts.outputDir = file::expandHome(parser.value(outputOpt).toStdString());
    }
    if (parser.isSet(configOpt)) {
        opts.configPath = file::expandHome(parser.value(configOpt).toStdString());
    }

    if (parser.isSet(normalizeOpt) && parser.isSet(noNormalizeOpt)) {
        return Result<AppOptions>::err(ErrorCode::InvalidInput,
                                       "--normalize and --no-normalize are exclusive");
    }
    if (parser.isSet(normalizeOpt)) {
        opts.normalize = true;
    } else if (parser.isSet(noNormalizeOpt)) {
        opts.normalize = false;
    }

    opts.offline = parser.isSet(offlineOpt);
    opts.debug = parser.isSet(debugOpt);
    return Result<AppOptions>::ok(std::move(opts));
}

Result<void> Application::init(const AppOptions& opts) {
    opts_ = opts;
    Logger::init("reelsync", opts.debug);

    auto loaded = opts.configPath ? CONFIG.load(*opts.configPath) : CONFIG.loadDefault();
    if (!loaded) {
        return loaded;
    }
    CONFIG.applyEnvironment();

    if (opts.debug) {
        CONFIG.setDebug(true);
    }
    Logger::setDebug(CONFIG.debug());

    if (opts.offline) {
        CONFIG.exporting().realtime = false;
    }
    if (opts.outputDir) {
        CONFIG.exporting().outputDirectory = *opts.outputDir;
    }
    if (opts.normalize) {
        CONFIG.normalization().enabled = *opts.normalize;
    }

    if (CONFIG.normalization().enabled && !CONFIG.normalization().isUsable()) {
        return Result<void>::err(ErrorCode::InvalidInput,
                                 "Voice normalization needs an API URL and a model name");
    }

    LOG_INFO("ReelSync starting: manifest={} realtime={}",
             opts.manifestPath.string(),
             CONFIG.exporting().realtime);
    return Result<void>::ok();
}

Result<ExportRequest> Application::buildRequest() const {
    auto manifest = ManifestLoader::load(opts_.manifestPath);
    if (!manifest) {
        return Result<ExportRequest>::err(manifest.error());
    }

    ExportRequest request;
    request.segments = std::move(manifest->segments);
    if (opts_.backdropPath) {
        request.backdrop = MediaSource::fromUri(opts_.backdropPath->string(), MediaKind::Image);
    } else if (manifest->backdrop) {
        request.backdrop = *manifest->backdrop;
    } else {
        return Result<ExportRequest>::err(ErrorCode::InvalidInput,
                                          "No backdrop image in manifest or on the command line");
    }

    if (CONFIG.normalization().isUsable()) {
        request.normalization = NormalizationOptions::fromConfig(CONFIG.normalization());
    }
    request.settings = ExportSettings::fromConfig();
    return Result<ExportRequest>::ok(std::move(request));
}

Result<fs::path> Application::writeOutput(const CaptureOutput& output) const {
    fs::path dir = CONFIG.exporting().outputDirectory;
    if (dir.empty()) {
        dir = fs::current_path();
    }
    if (!file::ensureDir(dir)) {
        return Result<fs::path>::err(ErrorCode::Capture,
                                     "Cannot create output directory " + dir.string());
    }

    const auto epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();
    fs::path target = dir / output.filename(CONFIG.exporting().filename, epochMs);

    auto written = file::writeBytes(target, output.bytes);
    if (!written) {
        return Result<fs::path>::err(written.error());
    }
    return Result<fs::path>::ok(std::move(target));
}

int Application::exec() {
    auto request = buildRequest();
    if (!request) {
        std::cerr << "Error: " << request.error().describe() << "\n";
        return 1;
    }

    ExportEngine engine(ExportServices::defaults());
    engine_ = &engine;
    engine.progressChanged.connect([](const ExportProgress& p) {
        std::cout << "[" << exportStageName(p.stage) << "] "
                  << static_cast<int>(p.percent) << "%";
        if (p.currentSegment && p.totalSegments) {
            std::cout << " (segment " << *p.currentSegment << "/" << *p.totalSegments << ")";
        }
        std::cout << std::endl;
    });

    auto output = engine.run(*request);
    engine_ = nullptr;
    if (!output) {
        LOG_ERROR("Export failed: {}", output.error().describe());
        std::cerr << "Error: " << output.error().describe() << "\n";
        return 1;
    }

    const auto& report = output->report;
    for (const auto& f : report.normalizationFailures) {
        std::cerr << "Warning: segment " << f.segmentIndex + 1
                  << " kept its original voice: " << f.message << "\n";
    }
    for (const auto& w : report.durationWarnings) {
        std::cerr << "Warning: segment " << w.segmentIndex + 1
                  << " changed length after normalization (" << w.originalDuration
                  << "s -> " << w.normalizedDuration << "s)\n";
    }

    auto path = writeOutput(*output);
    if (!path) {
        std::cerr << "Error: " << path.error().describe() << "\n";
        return 1;
    }

    std::cout << "Wrote " << path->string() << " (" << output->mimeType << ", "
              << report.segments.size() << " segments, " << report.renderedDuration()
              << "s)" << std::endl;
    return 0;
}

void Application::requestStop() {
    if (ExportEngine* engine = engine_.load()) {
        engine->requestStop();
    }
}

} // namespace rs
