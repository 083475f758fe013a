#include "ExportEngine.hpp"
#include <algorithm>
#include <cmath>
#include <QImage>
#include "SegmentPlan.hpp"
#include "SegmentSynchronizer.hpp"
#include "audio/AudioGraph.hpp"
#include "capture/CaptureSession.hpp"
#include "capture/EncoderSettings.hpp"
#include "capture/FFmpegCaptureSink.hpp"
#include "core/Logger.hpp"
#include "media/DurationResolver.hpp"
#include "media/MediaAssetHandle.hpp"
#include "media/MediaFetcher.hpp"
#include "normalize/VoiceNormalizationClient.hpp"
#include "normalize/VoiceNormalizer.hpp"
#include "render/CompositeRenderer.hpp"

namespace rs {

std::atomic<bool> ExportEngine::busy_{false};

namespace {

Error atStage(Error e, ExportStage stage, std::optional<usize> segment = std::nullopt) {
    e.inStage(exportStageName(stage));
    if (segment && !e.segmentIndex) {
        e.atSegment(*segment);
    }
    return e;
}

struct BusyGuard {
    std::atomic<bool>& flag;
    ~BusyGuard() {
        flag = false;
    }
};

} // namespace

ExportServices ExportServices::defaults() {
    ExportServices s;
    s.mediaFactory = std::make_shared<FFmpegMediaElementFactory>();
    s.codecProbe = std::make_shared<FFmpegCodecProbe>();
    s.sinkFactory = [] { return std::make_unique<FFmpegCaptureSink>(); };
    s.voiceConverter = std::make_shared<VoiceNormalizationClient>();
    return s;
}

// State of one run; lives on the stack of run()
struct ExportEngine::Impl {
    ExportEngine& engine;
    const ExportRequest& request;
    const ExportConfig& exportCfg;
    const CaptureConfig& captureCfg;
    AudioFormat format;

    std::vector<const Segment*> ready;
    CodecCandidate codec;
    QImage backdrop;

    // Index-aligned with ready; video and normalized entries may be null
    std::vector<std::unique_ptr<MediaAssetHandle>> speech;
    std::vector<std::unique_ptr<MediaAssetHandle>> video;
    std::vector<std::unique_ptr<MediaAssetHandle>> normalized;
    std::vector<SegmentPlan> plans;

    bool normalizationRan{false};
    ExportReport report;

    Impl(ExportEngine& e, const ExportRequest& r)
        : engine(e),
          request(r),
          exportCfg(r.settings.exporting),
          captureCfg(r.settings.capture) {
        format.sampleRate = captureCfg.sampleRate;
        format.channels = captureCfg.channels;
    }

    usize count() const {
        return ready.size();
    }

    Result<void> prepare();
    Result<void> load();
    void normalize();
    Result<void> plan();
    Result<std::vector<u8>> composite();
};

ExportEngine::ExportEngine(ExportServices services) : services_(std::move(services)) {
    if (!services_.mediaFactory) {
        services_.mediaFactory = std::make_shared<FFmpegMediaElementFactory>();
    }
    if (!services_.codecProbe) {
        services_.codecProbe = std::make_shared<FFmpegCodecProbe>();
    }
    if (!services_.sinkFactory) {
        services_.sinkFactory = [] { return std::make_unique<FFmpegCaptureSink>(); };
    }
}

ExportEngine::~ExportEngine() = default;

void ExportEngine::report(ExportStage stage,
                          f64 percent,
                          std::optional<usize> current,
                          std::optional<usize> total) {
    ExportProgress p;
    p.stage = stage;
    p.percent = std::clamp(percent, 0.0, 100.0);
    p.currentSegment = current;
    p.totalSegments = total;
    progressChanged.emitSignal(p);
}

Result<CaptureOutput> ExportEngine::run(const ExportRequest& request) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        return Result<CaptureOutput>::err(ErrorCode::Busy, "An export is already running");
    }
    BusyGuard guard{busy_};
    stopRequested_ = false;

    Impl impl(*this, request);

    auto failed = [](Error e) {
        LOG_ERROR("Export failed: {}", e.describe());
        return Result<CaptureOutput>::err(std::move(e));
    };

    report(ExportStage::Preparing, 0.0);
    if (auto r = impl.prepare(); !r) {
        return failed(r.error());
    }

    report(ExportStage::Loading, 5.0);
    if (auto r = impl.load(); !r) {
        return failed(r.error());
    }

    impl.normalize();

    if (auto r = impl.plan(); !r) {
        return failed(r.error());
    }

    auto bytes = impl.composite();
    if (!bytes) {
        if (bytes.error().code == ErrorCode::Cancelled) {
            LOG_INFO("Export cancelled");
            return Result<CaptureOutput>::err(bytes.error());
        }
        return failed(bytes.error());
    }

    CaptureOutput out;
    out.bytes = std::move(*bytes);
    out.mimeType = impl.codec.mime;
    out.extension = impl.codec.extension;
    out.report = std::move(impl.report);

    LOG_INFO("Video created: {:.2f} MB ({}), {:.2f}s in {} frames (planned {:.2f}s)",
             static_cast<f64>(out.bytes.size()) / 1024.0 / 1024.0,
             out.extension,
             out.report.renderedDuration(),
             out.report.framesWritten,
             out.report.totalDuration());
    report(ExportStage::Complete, 100.0);
    return Result<CaptureOutput>::ok(std::move(out));
}

Result<void> ExportEngine::Impl::prepare() {
    constexpr auto stage = ExportStage::Preparing;

    for (const auto& seg : request.segments) {
        if (isExportReady(seg)) {
            ready.push_back(&seg);
        }
    }
    if (ready.empty()) {
        return Result<void>::err(atStage(
                Error(ErrorCode::InvalidInput,
                      "No segments with completed audio available for export"),
                stage));
    }
    LOG_INFO("Exporting {} of {} segments", ready.size(), request.segments.size());

    if (format.sampleRate == 0 || format.channels == 0 || exportCfg.fps == 0) {
        return Result<void>::err(
                atStage(Error(ErrorCode::InvalidInput, "Invalid output format"), stage));
    }

    // Before anything is loaded or primed
    CodecNegotiator negotiator(engine.services_.codecProbe);
    auto negotiated = negotiator.negotiate(captureCfg.candidates);
    if (!negotiated) {
        return Result<void>::err(atStage(negotiated.error(), stage));
    }
    codec = *negotiated;

    if (request.backdrop.empty()) {
        return Result<void>::err(
                atStage(Error(ErrorCode::InvalidInput, "A backdrop image is required"), stage));
    }

    MediaFetcher fetcher;
    auto bytes = fetcher.fetch(request.backdrop);
    if (!bytes) {
        return Result<void>::err(atStage(bytes.error(), stage));
    }
    if (!backdrop.loadFromData(bytes->data(), static_cast<int>(bytes->size()))) {
        Error e(ErrorCode::AssetLoad, "Failed to load backdrop image");
        e.forAsset(request.backdrop.describe());
        return Result<void>::err(atStage(std::move(e), stage));
    }
    return Result<void>::ok();
}

Result<void> ExportEngine::Impl::load() {
    constexpr auto stage = ExportStage::Loading;
    const auto& factory = engine.services_.mediaFactory;

    for (usize i = 0; i < count(); ++i) {
        const Segment& seg = *ready[i];
        engine.report(stage, 5.0 + 20.0 * static_cast<f64>(i) / count(), i + 1, count());

        speech.push_back(std::make_unique<MediaAssetHandle>(*seg.audio, factory, format));
        video.push_back(expectsVisual(seg)
                                ? std::make_unique<MediaAssetHandle>(*seg.video, factory, format)
                                : nullptr);
        normalized.push_back(nullptr);

        auto speechDuration = DurationResolver::resolve(*speech[i]);
        std::optional<std::future<Result<f64>>> videoDuration;
        if (video[i]) {
            videoDuration = DurationResolver::resolve(*video[i]);
        }

        auto s = speechDuration.get();
        auto v = videoDuration ? videoDuration->get() : Result<f64>::ok(0.0);
        if (!s) {
            return Result<void>::err(atStage(s.error(), stage, i));
        }
        if (!v) {
            return Result<void>::err(atStage(v.error(), stage, i));
        }
    }
    return Result<void>::ok();
}

void ExportEngine::Impl::normalize() {
    constexpr auto stage = ExportStage::Normalizing;
    if (!request.normalization) {
        return;
    }

    auto converter = engine.services_.voiceConverter;
    if (!converter) {
        LOG_WARN("Voice normalization requested but no converter is available");
        return;
    }

    auto extractor = engine.services_.extractor;
    if (!extractor) {
        extractor = std::make_shared<AudioExtractor>(
                AudioExtractor::withDefaults(MediaFetcher(), exportCfg.fps, exportCfg.realtime));
    }

    VoiceNormalizer normalizer(*converter, *extractor, *request.normalization);
    normalizationRan = true;

    usize converted = 0;
    for (usize i = 0; i < count(); ++i) {
        engine.report(stage, 25.0 + 15.0 * static_cast<f64>(i) / count(), i + 1, count());

        auto recordFailure = [&](const Error& e) {
            LOG_WARN("Voice normalization failed for segment {}, keeping original audio: {}",
                     i + 1,
                     e.message);
            report.normalizationFailures.push_back({i, e.message});
        };

        MediaAssetHandle* videoInput = nullptr;
        if (video[i] && exportCfg.videoAudioReplacesSpeech && video[i]->element().hasAudio()) {
            videoInput = video[i].get();
        }

        auto source = normalizer.normalize(*speech[i], videoInput);
        if (!source) {
            recordFailure(source.error());
            continue;
        }

        auto handle = std::make_unique<MediaAssetHandle>(
                *source, engine.services_.mediaFactory, format);
        auto duration = DurationResolver::resolve(*handle).get();
        if (!duration) {
            Error e(ErrorCode::Normalization,
                    "Converted audio could not be loaded: " + duration.error().message);
            recordFailure(e);
            continue;
        }

        const f64 original = speech[i]->duration().value_or(0.0);
        if (std::abs(*duration - original) > exportCfg.durationDivergenceWarning) {
            LOG_WARN("Segment {}: normalized audio is {:.2f}s but the original is {:.2f}s; "
                     "the normalized duration is used",
                     i + 1,
                     *duration,
                     original);
            report.durationWarnings.push_back({i, original, *duration});
        }

        LOG_DEBUG("Segment {} normalized: {:.2f}s -> {:.2f}s", i + 1, original, *duration);
        normalized[i] = std::move(handle);
        ++converted;
    }
    LOG_INFO("Voice normalization: {} of {} segments converted", converted, count());
}

Result<void> ExportEngine::Impl::plan() {
    plans.reserve(count());
    for (usize i = 0; i < count(); ++i) {
        auto p = SegmentPlan::build(i, *speech[i], normalized[i].get(), video[i].get());
        if (!p) {
            return Result<void>::err(atStage(p.error(), ExportStage::Loading, i));
        }
        plans.push_back(std::move(*p));

        const SegmentPlan& sp = plans.back();
        SegmentTiming t;
        t.index = i;
        t.id = ready[i]->id;
        t.speechDuration = speech[i]->duration().value_or(0.0);
        if (sp.normalized()) {
            t.normalizedDuration = sp.audioDuration();
        }
        if (sp.hasVisual()) {
            t.videoDuration = sp.videoDuration();
        }
        t.duration = sp.duration();
        report.segments.push_back(t);

        LOG_INFO("Segment {}: speech={:.2f}s, video={:.2f}s, using={:.2f}s",
                 i + 1,
                 sp.audioDuration(),
                 sp.hasVisual() ? sp.videoDuration() : 0.0,
                 sp.duration());
    }
    return Result<void>::ok();
}

Result<std::vector<u8>> ExportEngine::Impl::composite() {
    constexpr auto stage = ExportStage::Compositing;
    auto fail = [&](Error e, std::optional<usize> segment = std::nullopt) {
        return Result<std::vector<u8>>::err(atStage(std::move(e), stage, segment));
    };

    const u32 fps = exportCfg.fps;
    const f64 dt = 1.0 / fps;
    const f64 base = normalizationRan ? 40.0 : 25.0;

    CaptureSession session(engine.services_.sinkFactory());
    if (auto r = session.start(EncoderSettings::from(codec, exportCfg, captureCfg)); !r) {
        return fail(r.error());
    }

    AudioGraph graph(format, fps);
    CompositeRenderer renderer(exportCfg.width, exportCfg.height, exportCfg.background);
    renderer.setBackdrop(backdrop);

    auto clock = engine.services_.clockFactory ? engine.services_.clockFactory()
                                               : makeFrameClock(exportCfg.realtime);
    clock->start(fps);

    SyncPolicy policy;
    policy.completionTolerance = exportCfg.completionTolerance;
    policy.videoAudioReplacesSpeech = exportCfg.videoAudioReplacesSpeech;

    for (usize i = 0; i < plans.size(); ++i) {
        engine.report(stage,
                      base + (90.0 - base) * static_cast<f64>(i) / plans.size(),
                      i + 1,
                      plans.size());

        const SegmentPlan& sp = plans[i];
        SegmentSynchronizer sync(sp, graph, policy);
        if (auto r = sync.prime(); !r) {
            return fail(r.error(), i);
        }
        if (auto r = sync.start(); !r) {
            return fail(r.error(), i);
        }

        // Bound for elements that neither end nor advance
        const u64 maxFrames = static_cast<u64>(std::ceil((sp.duration() + 2.0) * fps));
        u64 frames = 0;
        while (!sync.isDone()) {
            if (frames >= maxFrames) {
                LOG_WARN("Segment {} did not complete after {} frames", i + 1, frames);
                sync.finish();
                break;
            }
            clock->waitNextFrame();

            renderer.compose(sync.showVideo() ? sync.videoFrame() : QImage());
            if (auto r = sync.advance(dt); !r) {
                return fail(r.error(), i);
            }
            const auto audio = graph.renderPeriod();
            if (auto r = session.pushFrame(renderer.surface(), audio); !r) {
                return fail(r.error(), i);
            }
            ++frames;

            sync.evaluate();
        }
        report.segments[i].frames = frames;
        LOG_DEBUG("Segment {} done after {} frames", i + 1, frames);

        if (engine.stopRequested_) {
            session.abort();
            return fail(Error(ErrorCode::Cancelled, "Export cancelled"), i);
        }
    }

    engine.report(ExportStage::Finalizing, 90.0);
    auto bytes = session.finish();
    if (!bytes) {
        return Result<std::vector<u8>>::err(atStage(bytes.error(), ExportStage::Finalizing));
    }
    report.framesWritten = session.framesPushed();
    report.fps = fps;
    return bytes;
}

} // namespace rs
