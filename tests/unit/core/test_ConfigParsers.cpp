#include <toml++/toml.h>
#include <QTemporaryDir>
#include <QtTest>
#include "core/Config.hpp"
#include "core/ConfigParsers.hpp"

using namespace rs;

class TestConfigParsers : public QObject {
    Q_OBJECT

private slots:
    void testParseExport() {
        auto tbl = toml::parse(R"(
            [export]
            width = 1080
            height = 1920
            fps = 25
            background = "#102030"
            completion_tolerance = 0.1
            realtime = false
            video_audio_replaces_speech = false
            filename = "take-{timestamp}"
        )");

        ExportConfig cfg;
        ConfigParsers::parseExport(tbl, cfg);

        QCOMPARE(cfg.width, 1080u);
        QCOMPARE(cfg.height, 1920u);
        QCOMPARE(cfg.fps, 25u);
        QVERIFY(cfg.background == Color::fromHex("#102030"));
        QCOMPARE(cfg.completionTolerance, 0.1);
        QCOMPARE(cfg.realtime, false);
        QCOMPARE(cfg.videoAudioReplacesSpeech, false);
        QCOMPARE(cfg.filename, std::string("take-{timestamp}"));
    }

    void testExportClampsAndEvens() {
        auto tbl = toml::parse(R"(
            [export]
            width = 721
            height = 10
            fps = 0
        )");

        ExportConfig cfg;
        ConfigParsers::parseExport(tbl, cfg);

        QCOMPARE(cfg.width, 722u);
        QCOMPARE(cfg.height, 160u);
        QCOMPARE(cfg.fps, 1u);
    }

    void testMissingSectionKeepsDefaults() {
        auto tbl = toml::parse(R"(
            [general]
            debug = true
        )");

        ExportConfig cfg;
        ConfigParsers::parseExport(tbl, cfg);

        QCOMPARE(cfg.width, 720u);
        QCOMPARE(cfg.height, 1280u);
        QCOMPARE(cfg.fps, 30u);
    }

    void testParseCaptureCandidates() {
        auto tbl = toml::parse(R"(
            [capture]
            sample_rate = 44100
            channels = 1

            [[capture.candidates]]
            mime = "video/webm"
            container = "webm"
            video_codec = "libvpx"
            audio_codec = "libvorbis"

            [[capture.candidates]]
            mime = "broken"
            container = "mp4"
        )");

        CaptureConfig cfg;
        ConfigParsers::parseCapture(tbl, cfg);

        QCOMPARE(cfg.sampleRate, 44100u);
        QCOMPARE(cfg.channels, 1u);
        QCOMPARE(cfg.candidates.size(), size_t(1));
        QCOMPARE(cfg.candidates[0].videoCodec, std::string("libvpx"));
        QCOMPARE(cfg.candidates[0].extension, std::string("webm"));
    }

    void testParseNormalization() {
        auto tbl = toml::parse(R"(
            [normalization]
            enabled = true
            api_url = "http://localhost:8001"
            model_name = "narrator"
            index_rate = 1.5
        )");

        NormalizationConfig cfg;
        ConfigParsers::parseNormalization(tbl, cfg);

        QVERIFY(cfg.isUsable());
        QCOMPARE(cfg.modelName, std::string("narrator"));
        QCOMPARE(cfg.f0Method, std::string("rmvpe"));
        QCOMPARE(cfg.indexRate, 1.0);
    }

    void testSerialize() {
        ExportConfig exporting;
        exporting.fps = 24;
        CaptureConfig capture;
        NormalizationConfig normalization;
        normalization.modelName = "narrator";

        auto tbl = ConfigParsers::serialize(exporting, capture, normalization, false);

        auto exportTbl = tbl["export"].as_table();
        QVERIFY(exportTbl != nullptr);
        QCOMPARE((*exportTbl)["fps"].value<i64>().value_or(0), i64(24));
        QCOMPARE(tbl["normalization"]["model_name"].value<std::string>().value_or(""),
                 std::string("narrator"));

        ExportConfig reparsed;
        CaptureConfig reparsedCapture;
        ConfigParsers::parseExport(tbl, reparsed);
        ConfigParsers::parseCapture(tbl, reparsedCapture);
        QCOMPARE(reparsed.fps, 24u);
        QVERIFY(reparsedCapture.candidates == capture.candidates);
    }
    void testSaveAndLoadFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const fs::path path = fs::path(dir.path().toStdString()) / "config.toml";

        CONFIG.exporting().fps = 24;
        QVERIFY(CONFIG.save(path).isOk());
        QVERIFY(fs::exists(path));
        QVERIFY(!fs::exists(fs::path(path.string() + ".tmp")));

        CONFIG.exporting().fps = 30;
        QVERIFY(CONFIG.load(path).isOk());
        QVERIFY(!CONFIG.isDirty());
        const Config& loaded = CONFIG;
        QCOMPARE(loaded.exporting().fps, 24u);

        CONFIG.exporting().fps = 30;
        CONFIG.markClean();
    }

    void testLoadMissingFile() {
        auto res = CONFIG.load("/nonexistent/reelsync/config.toml");
        QVERIFY(res.isErr());
        QCOMPARE(res.error().code, ErrorCode::InvalidInput);
    }
};

int runTestConfigParsers(int argc, char** argv) {
    TestConfigParsers tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_ConfigParsers.moc"
