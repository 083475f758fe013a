#include <QTemporaryDir>
#include <QtTest>
#include <cmath>
#include <fstream>
#include "audio/AudioExtractor.hpp"
#include "audio/PcmEncoder.hpp"
#include "media/AudioDecoder.hpp"
#include "media/FFmpegMediaElement.hpp"
#include "media/FFmpegUtils.hpp"
#include "media/MediaAssetHandle.hpp"
#include "media/MediaElementFactory.hpp"

using namespace rs;

namespace {

// Constant 0.5 (16384) on both channels
std::vector<i16> steadyTone(usize frames) {
    return std::vector<i16>(frames * 2, 16384);
}

fs::path writeFile(const QTemporaryDir& dir, const std::string& name, const std::vector<u8>& bytes) {
    const fs::path path = fs::path(dir.path().toStdString()) / name;
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path;
}

int failingRead(void*, u8*, int) {
    return AVERROR(EIO);
}

int exhaustedRead(void*, u8*, int) {
    return AVERROR_EOF;
}

// Reads one byte through a callback AVIO so the context records the outcome
bool endedCleanlyAfter(int (*readFn)(void*, u8*, int), int readResult) {
    auto* buffer = static_cast<u8*>(av_malloc(4096));
    AVIOContextPtr avio(avio_alloc_context(buffer, 4096, 0, nullptr, readFn, nullptr, nullptr));
    if (!avio) {
        av_free(buffer);
        return false;
    }
    avio_r8(avio.get());

    AVFormatContext* fmt = avformat_alloc_context();
    fmt->pb = avio.get();
    const bool clean = readEndedCleanly(fmt, readResult);
    fmt->pb = nullptr;
    avformat_free_context(fmt);
    return clean;
}

} // namespace

class TestFFmpegMedia : public QObject {
    Q_OBJECT

private slots:
    void testDecodeWavFileKeepsSamples() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const auto samples = steadyTone(48000);
        auto wav = PcmEncoder::encode(samples, 2, 48000);
        QVERIFY(wav.isOk());
        const fs::path path = writeFile(dir, "tone.wav", *wav);

        auto pcm = AudioDecoder::decode(MediaSource::fromUri(path.string(), MediaKind::Audio));
        QVERIFY(pcm.isOk());
        QCOMPARE(pcm->sampleRate, 48000u);
        QCOMPARE(pcm->channels, 2u);
        QCOMPARE(pcm->frames(), usize(48000));
        QVERIFY(pcm->samples == samples);
    }

    void testDecodeTruncatedWav() {
        auto wav = PcmEncoder::encode(steadyTone(4800), 2, 48000);
        QVERIFY(wav.isOk());
        // The data chunk still claims all 4800 frames
        wav->resize(PcmEncoder::kHeaderSize + 1000 * 4);

        auto pcm = AudioDecoder::decode(MediaSource::fromBytes(*wav, "audio/wav", MediaKind::Audio));
        QVERIFY(pcm.isOk());
        QCOMPARE(pcm->frames(), usize(1000));
        QCOMPARE(pcm->samples.front(), i16(16384));
    }

    void testReadErrorIsNotEndOfInput() {
        QVERIFY(readEndedCleanly(nullptr, AVERROR_EOF));
        QVERIFY(endedCleanlyAfter(exhaustedRead, AVERROR_EOF));
        QVERIFY(endedCleanlyAfter(exhaustedRead, AVERROR(EIO)));
        QVERIFY(!endedCleanlyAfter(failingRead, AVERROR(EIO)));
        QVERIFY(!readEndedCleanly(nullptr, AVERROR(EIO)));
    }

    void testElementPlaysWavToEnd() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto wav = PcmEncoder::encode(steadyTone(48000), 2, 48000);
        QVERIFY(wav.isOk());
        const fs::path path = writeFile(dir, "tone.wav", *wav);

        FFmpegMediaElement el(MediaSource::fromUri(path.string(), MediaKind::Audio), AudioFormat{48000, 2});
        QVERIFY(el.load().isOk());
        QVERIFY(el.isLoaded());
        QVERIFY(el.hasAudio());
        QVERIFY(!el.hasVideo());
        QVERIFY(el.duration().has_value());
        QVERIFY(std::abs(*el.duration() - 1.0) < 1e-3);

        int ended = 0;
        el.endReached.connect([&ended] { ++ended; });
        el.setAudioRouted(true);
        el.play();

        std::vector<f32> drained;
        int steps = 0;
        while (!el.ended() && steps < 40) {
            QVERIFY(el.advance(1.0 / 30).isOk());
            el.drainAudio(drained, 48000);
            ++steps;
        }
        QVERIFY(el.ended());
        QVERIFY(!el.isPlaying());
        QCOMPARE(ended, 1);
        QVERIFY(steps >= 30 && steps <= 32);

        QCOMPARE(drained.size(), usize(48000 * 2));
        for (f32 s : drained) {
            QVERIFY(std::abs(s - 0.5f) < 1e-3f);
        }

        // Further advances are no-ops once ended
        QVERIFY(el.advance(1.0 / 30).isOk());
        QCOMPARE(ended, 1);
    }

    void testEmptyWavEndsOnFirstAdvance() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto wav = PcmEncoder::encode(std::span<const i16>(), 2, 48000);
        QVERIFY(wav.isOk());
        QCOMPARE(wav->size(), PcmEncoder::kHeaderSize);
        const fs::path path = writeFile(dir, "empty.wav", *wav);

        FFmpegMediaElement el(MediaSource::fromUri(path.string(), MediaKind::Audio), AudioFormat{48000, 2});
        QVERIFY(el.load().isOk());
        QVERIFY(el.duration().has_value());
        QVERIFY(*el.duration() >= 0.0);
        QVERIFY(*el.duration() < 0.01);

        el.play();
        QVERIFY(el.advance(1.0 / 30).isOk());
        QVERIFY(el.ended());
    }

    void testFastDecodeReturnsWav() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        auto wav = PcmEncoder::encode(steadyTone(9600), 2, 48000);
        QVERIFY(wav.isOk());
        const fs::path path = writeFile(dir, "clip.wav", *wav);

        MediaAssetHandle handle(MediaSource::fromUri(path.string(), MediaKind::Video),
                                std::make_shared<FFmpegMediaElementFactory>());
        FastDecodeStrategy strategy;
        auto bytes = strategy.extract(handle);
        QVERIFY(bytes.isOk());
        QVERIFY(*bytes == *wav);
    }

    void testMissingFileFailsToLoad() {
        FFmpegMediaElement el(MediaSource::fromUri("/nonexistent/reelsync/clip.wav", MediaKind::Audio),
                              AudioFormat{});
        auto r = el.load();
        QVERIFY(r.isErr());
        QVERIFY(r.error().code == ErrorCode::AssetLoad);
        QVERIFY(!el.isLoaded());
    }
};

int runTestFFmpegMedia(int argc, char** argv) {
    TestFFmpegMedia tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_FFmpegMedia.moc"
