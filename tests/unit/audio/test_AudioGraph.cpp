#include <QtTest>
#include <algorithm>
#include "audio/AudioGraph.hpp"
#include "fixtures/FakeMedia.hpp"

using namespace rs;
using namespace rs::test;

class TestAudioGraph : public QObject {
    Q_OBJECT

private slots:
    void init() {
        factory_ = std::make_shared<FakeMediaFactory>();
        factory_->add("speech", {.duration = 1.0, .audioValue = 0.25f});
        factory_->add("music", {.duration = 1.0, .audioValue = 0.5f});
    }

    void testPeriodFrameCounts() {
        AudioGraph even({44100, 2}, 30);
        QCOMPARE(even.nextPeriodFrames(), size_t(1470));

        // 48000 / 7 leaves a remainder; periods alternate but add up exactly
        AudioGraph uneven({48000, 1}, 7);
        usize total = 0;
        for (int i = 0; i < 7; ++i) {
            const usize n = uneven.nextPeriodFrames();
            QVERIFY(n == 6857 || n == 6858);
            total += uneven.renderPeriod().size();
        }
        QCOMPARE(total, size_t(48000));

        AudioGraph odd({48000, 1}, 29);
        total = 0;
        for (int i = 0; i < 29; ++i) {
            total += odd.renderPeriod().size();
        }
        QCOMPARE(total, size_t(48000));
        QCOMPARE(odd.periodsRendered(), u64(29));
    }

    void testSilenceWithoutNodes() {
        AudioGraph graph({48000, 2}, 30);
        auto out = graph.renderPeriod();
        QCOMPARE(out.size(), size_t(1600 * 2));
        QVERIFY(std::all_of(out.begin(), out.end(), [](f32 s) { return s == 0.0f; }));
    }

    void testMixesConnectedNodeOnly() {
        MediaAssetHandle speech(MediaSource::fromUri("speech", MediaKind::Audio), factory_, {48000, 2});
        MediaAssetHandle music(MediaSource::fromUri("music", MediaKind::Audio), factory_, {48000, 2});
        AudioGraph graph({48000, 2}, 30);
        QVERIFY(speech.load().isOk());
        QVERIFY(music.load().isOk());

        auto node = graph.createSource(speech);
        QVERIFY(node.isOk());
        QVERIFY(!(*node)->isConnected());
        QVERIFY((*node)->connect().isOk());
        QCOMPARE(graph.connectedCount(), size_t(1));

        speech.element().play();
        music.element().play();
        QVERIFY(speech.element().advance(1.0 / 30).isOk());
        QVERIFY(music.element().advance(1.0 / 30).isOk());

        auto out = graph.renderPeriod();
        QCOMPARE(out.size(), size_t(3200));
        QVERIFY(std::all_of(out.begin(), out.end(), [](f32 s) { return s == 0.25f; }));
    }

    void testSecondWiringIsProgrammingError() {
        MediaAssetHandle speech(MediaSource::fromUri("speech", MediaKind::Audio), factory_, {48000, 2});
        AudioGraph graph({48000, 2}, 30);
        QVERIFY(speech.load().isOk());

        QVERIFY(graph.createSource(speech).isOk());
        QVERIFY(speech.isWired());

        auto again = graph.createSource(speech);
        QVERIFY(again.isErr());
        QVERIFY(again.error().code == ErrorCode::Programming);

        AudioGraph other({48000, 2}, 30);
        auto elsewhere = other.createSource(speech);
        QVERIFY(elsewhere.isErr());
        QVERIFY(elsewhere.error().code == ErrorCode::Programming);
        QCOMPARE(other.nodeCount(), size_t(0));
    }

    void testDoubleConnectIsProgrammingError() {
        MediaAssetHandle speech(MediaSource::fromUri("speech", MediaKind::Audio), factory_, {48000, 2});
        AudioGraph graph({48000, 2}, 30);
        QVERIFY(speech.load().isOk());
        auto node = *graph.createSource(speech);

        QVERIFY(node->connect().isOk());
        auto again = node->connect();
        QVERIFY(again.isErr());
        QVERIFY(again.error().code == ErrorCode::Programming);

        node->disconnect();
        QCOMPARE(graph.connectedCount(), size_t(0));
    }

    void testFormatMismatch() {
        MediaAssetHandle speech(MediaSource::fromUri("speech", MediaKind::Audio), factory_, {48000, 2});
        AudioGraph graph({44100, 2}, 30);
        QVERIFY(speech.load().isOk());
        auto node = graph.createSource(speech);
        QVERIFY(node.isErr());
        QVERIFY(!speech.isWired());
    }

    void testMixClamps() {
        factory_->add("loud", {.duration = 1.0, .audioValue = 0.75f});
        MediaAssetHandle a(MediaSource::fromUri("loud", MediaKind::Audio), factory_, {8000, 1});
        MediaAssetHandle b(MediaSource::fromUri("loud", MediaKind::Audio), factory_, {8000, 1});
        AudioGraph graph({8000, 1}, 10);
        QVERIFY(a.load().isOk() && b.load().isOk());
        QVERIFY((*graph.createSource(a))->connect().isOk());
        QVERIFY((*graph.createSource(b))->connect().isOk());

        a.element().play();
        b.element().play();
        QVERIFY(a.element().advance(0.1).isOk());
        QVERIFY(b.element().advance(0.1).isOk());

        auto out = graph.renderPeriod();
        QCOMPARE(out.size(), size_t(800));
        QCOMPARE(out.front(), 1.0f);
    }

private:
    std::shared_ptr<FakeMediaFactory> factory_;
};

int runTestAudioGraph(int argc, char** argv) {
    TestAudioGraph tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_AudioGraph.moc"
