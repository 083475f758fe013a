#include <QtTest>
#include "capture/CaptureSession.hpp"
#include "capture/CodecNegotiator.hpp"
#include "fixtures/FakeServices.hpp"

using namespace rs;
using namespace rs::test;

class TestCodecNegotiator : public QObject {
    Q_OBJECT

private slots:
    void testFirstSupportedWins() {
        auto probe = std::make_shared<FakeCodecProbe>(std::set<std::string>{"libvpx", "mpeg4"});
        CodecNegotiator negotiator(probe);

        auto picked = negotiator.negotiate(defaultCodecCandidates());
        QVERIFY(picked.isOk());
        QCOMPARE(picked->mime, std::string("video/webm;codecs=vp8,opus"));
        QCOMPARE(picked->extension, std::string("webm"));
        // Stops probing once a candidate is accepted
        QCOMPARE(probe->probed.size(), size_t(4));
    }

    void testPreferenceOrder() {
        auto probe = std::make_shared<FakeCodecProbe>(
                std::set<std::string>{"libx264", "libvpx-vp9", "mpeg4"});
        CodecNegotiator negotiator(probe);

        auto picked = negotiator.negotiate(defaultCodecCandidates());
        QVERIFY(picked.isOk());
        QCOMPARE(picked->videoCodec, std::string("libx264"));
        QCOMPARE(picked->container, std::string("mp4"));
    }

    void testNothingSupported() {
        auto probe = std::make_shared<FakeCodecProbe>(std::set<std::string>{});
        CodecNegotiator negotiator(probe);

        auto picked = negotiator.negotiate(defaultCodecCandidates());
        QVERIFY(picked.isErr());
        QVERIFY(picked.error().code == ErrorCode::CodecNegotiation);
        QCOMPARE(probe->probed.size(), defaultCodecCandidates().size());
    }

    void testEmptyList() {
        CodecNegotiator negotiator(std::make_shared<FakeCodecProbe>(std::set<std::string>{"mpeg4"}));
        QVERIFY(negotiator.negotiate({}).isErr());
    }

    void testEncoderSettingsFromConfig() {
        ExportConfig exporting;
        exporting.width = 360;
        exporting.height = 640;
        exporting.fps = 25;
        CaptureConfig capture;
        capture.sampleRate = 44100;
        capture.channels = 1;

        auto settings = EncoderSettings::from(defaultCodecCandidates().back(), exporting, capture);
        QCOMPARE(settings.width, 360u);
        QCOMPARE(settings.height, 640u);
        QCOMPARE(settings.fps, 25u);
        QVERIFY(settings.audio == (AudioFormat{44100, 1}));
        QCOMPARE(settings.videoBitrate, 8000u);
        QVERIFY(settings.validate().isOk());

        settings.width = 361;
        QVERIFY(settings.validate().isErr());
    }

    void testSessionLifecycle() {
        auto log = std::make_shared<CaptureLog>();
        CaptureSession session(std::make_unique<RecordingCaptureSink>(log));

        auto settings = EncoderSettings::from(defaultCodecCandidates().back(), {}, {});
        settings.width = 16;
        settings.height = 16;
        QVERIFY(session.start(settings).isOk());
        QVERIFY(session.isActive());

        QImage frame(16, 16, QImage::Format_RGBA8888);
        frame.fill(Qt::green);
        std::vector<f32> audio(3200, 0.1f);
        QVERIFY(session.pushFrame(frame, audio).isOk());
        QVERIFY(session.pushFrame(frame, audio).isOk());
        QCOMPARE(session.framesPushed(), u64(2));

        auto bytes = session.finish();
        QVERIFY(bytes.isOk());
        QVERIFY(!bytes->empty());
        QVERIFY(log->finished);
        QVERIFY(!log->discarded);
        QCOMPARE(log->audio.size(), size_t(6400));
    }

    void testSessionFailureDiscards() {
        auto log = std::make_shared<CaptureLog>();
        log->failAtFrame = 2;
        CaptureSession session(std::make_unique<RecordingCaptureSink>(log));

        auto settings = EncoderSettings::from(defaultCodecCandidates().back(), {}, {});
        QVERIFY(session.start(settings).isOk());

        QImage frame(8, 8, QImage::Format_RGBA8888);
        frame.fill(Qt::green);
        QVERIFY(session.pushFrame(frame, {}).isOk());
        auto failed = session.pushFrame(frame, {});
        QVERIFY(failed.isErr());
        QVERIFY(failed.error().code == ErrorCode::Capture);
        QVERIFY(log->discarded);
        QVERIFY(!session.isActive());
    }

    void testSessionRejectsInvalidSettings() {
        auto log = std::make_shared<CaptureLog>();
        CaptureSession session(std::make_unique<RecordingCaptureSink>(log));

        EncoderSettings settings;
        auto started = session.start(settings);
        QVERIFY(started.isErr());
        QVERIFY(started.error().code == ErrorCode::InvalidInput);
        QVERIFY(!log->opened);
    }
};

int runTestCodecNegotiator(int argc, char** argv) {
    TestCodecNegotiator tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_CodecNegotiator.moc"
