#include <QTemporaryDir>
#include <QtTest>
#include <fstream>
#include "export/ExportTypes.hpp"
#include "export/ManifestLoader.hpp"

using namespace rs;

class TestManifestLoader : public QObject {
    Q_OBJECT

private slots:
    void testParsesSegments() {
        auto manifest = ManifestLoader::parse(R"(
            backdrop = "images/character.png"

            [[segment]]
            id = "intro"
            text = "Good evening."
            gesture = "beat"
            gesture_description = "both hands, downward"
            audio = "audio/intro.wav"
            video = "https://cdn.example.com/intro.mp4"

            [[segment]]
            text = "Thank you."
            audio = "audio/outro.wav"
            audio_status = "generating"
        )",
                                              "/data/show");
        QVERIFY(manifest.isOk());
        QCOMPARE(manifest->segments.size(), size_t(2));
        QVERIFY(manifest->backdrop.has_value());
        QCOMPARE(manifest->backdrop->uri(), std::string("/data/show/images/character.png"));

        const Segment& intro = manifest->segments[0];
        QCOMPARE(intro.id, std::string("intro"));
        QVERIFY(intro.gesture == GestureType::Beat);
        QCOMPARE(intro.gestureDescription, std::string("both hands, downward"));
        QVERIFY(intro.audioStatus == AssetStatus::Completed);
        QCOMPARE(intro.audio->uri(), std::string("/data/show/audio/intro.wav"));
        QCOMPARE(intro.video->uri(), std::string("https://cdn.example.com/intro.mp4"));
        QVERIFY(expectsVisual(intro));

        const Segment& outro = manifest->segments[1];
        QCOMPARE(outro.id, std::string("segment-2"));
        QVERIFY(outro.gesture == GestureType::None);
        QVERIFY(outro.audioStatus == AssetStatus::Generating);
        QVERIFY(!isExportReady(outro));
        QVERIFY(!outro.video.has_value());
    }

    void testUnknownGesture() {
        auto manifest = ManifestLoader::parse(R"(
            [[segment]]
            audio = "a.wav"
            gesture = "wave"
        )",
                                              "/tmp");
        QVERIFY(manifest.isErr());
        QVERIFY(manifest.error().code == ErrorCode::InvalidInput);
        QVERIFY(manifest.error().segmentIndex == std::optional<usize>(0));
    }

    void testMissingSegments() {
        auto manifest = ManifestLoader::parse("backdrop = \"x.png\"\n", "/tmp");
        QVERIFY(manifest.isErr());
        QVERIFY(manifest.error().code == ErrorCode::InvalidInput);
    }

    void testSyntaxError() {
        auto manifest = ManifestLoader::parse("[[segment]\naudio = ", "/tmp");
        QVERIFY(manifest.isErr());
        QVERIFY(manifest.error().code == ErrorCode::InvalidInput);
    }

    void testLoadResolvesAgainstManifestDir() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const fs::path root = dir.path().toStdString();
        {
            std::ofstream out(root / "show.toml");
            out << "[[segment]]\naudio = \"clip.wav\"\n";
        }

        auto manifest = ManifestLoader::load(root / "show.toml");
        QVERIFY(manifest.isOk());
        QCOMPARE(manifest->segments[0].audio->uri(), (root / "clip.wav").string());
        QVERIFY(!manifest->backdrop.has_value());
    }

    void testLoadMissingFile() {
        auto manifest = ManifestLoader::load("/nonexistent/reelsync/show.toml");
        QVERIFY(manifest.isErr());
        QVERIFY(manifest.error().code == ErrorCode::InvalidInput);
    }

    void testReadiness() {
        Segment ready;
        ready.audioStatus = AssetStatus::Completed;
        ready.audio = MediaSource::fromUri("a.wav", MediaKind::Audio);

        Segment pending = ready;
        pending.audioStatus = AssetStatus::Error;

        Segment noUrl;
        noUrl.audioStatus = AssetStatus::Completed;

        QVERIFY(isExportReady(ready));
        QVERIFY(!isExportReady(pending));
        QVERIFY(!isExportReady(noUrl));
        QVERIFY(canExport({pending, ready}));
        QVERIFY(!canExport({pending, noUrl}));
        QVERIFY(!canExport({}));

        // A gesture without a finished video is shown as backdrop only
        ready.gesture = GestureType::Iconic;
        ready.video = MediaSource::fromUri("g.mp4", MediaKind::Video);
        ready.videoStatus = AssetStatus::Generating;
        QVERIFY(!expectsVisual(ready));
        ready.videoStatus = AssetStatus::Completed;
        QVERIFY(expectsVisual(ready));
        ready.gesture = GestureType::None;
        QVERIFY(!expectsVisual(ready));
    }

    void testOutputFilename() {
        CaptureOutput out;
        out.extension = "webm";
        QCOMPARE(out.filename("rehearsal-composed-{timestamp}", 1700000000123),
                 std::string("rehearsal-composed-1700000000123.webm"));
        QCOMPARE(out.filename("take", 5), std::string("take.webm"));
    }

    void testRenderedDurationFollowsFrameCount() {
        ExportReport report;
        SegmentTiming first;
        first.duration = 2.0;
        SegmentTiming second;
        second.index = 1;
        second.duration = 1.5;
        report.segments = {first, second};
        report.framesWritten = 102;
        QCOMPARE(report.renderedDuration(), 0.0);
        report.fps = 30;
        QCOMPARE(report.totalDuration(), 3.5);
        QCOMPARE(report.renderedDuration(), 3.4);
    }

    void testNames() {
        QCOMPARE(std::string(gestureTypeName(GestureType::Metaphoric)), std::string("metaphoric"));
        QVERIFY(parseGestureType("deictic") == GestureType::Deictic);
        QVERIFY(!parseGestureType("shrug").has_value());
        QCOMPARE(std::string(exportStageName(ExportStage::Compositing)), std::string("compositing"));
    }
};

int runTestManifestLoader(int argc, char** argv) {
    TestManifestLoader tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ManifestLoader.moc"
