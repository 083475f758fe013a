#include <QtTest>
#include "fixtures/FakeMedia.hpp"
#include "media/DurationResolver.hpp"
#include "media/MediaAssetHandle.hpp"

using namespace rs;
using namespace rs::test;

class TestDurationResolver : public QObject {
    Q_OBJECT

private slots:
    void init() {
        factory_ = std::make_shared<FakeMediaFactory>();
        factory_->add("a.wav", {.duration = 1.5});
        factory_->add("b.mp4", {.duration = 4.25, .hasVideo = true});
        factory_->add("broken.mp4", {.loadError = "moov atom not found"});
    }

    void testResolvesDuration() {
        MediaAssetHandle handle(MediaSource::fromUri("a.wav", MediaKind::Audio), factory_);
        QVERIFY(!handle.isLoaded());
        QVERIFY(!handle.duration().has_value());

        auto d = DurationResolver::resolve(handle).get();
        QVERIFY(d.isOk());
        QCOMPARE(*d, 1.5);
        QVERIFY(handle.isLoaded());
    }

    void testIdempotent() {
        MediaAssetHandle handle(MediaSource::fromUri("b.mp4", MediaKind::Video), factory_);
        auto first = DurationResolver::resolve(handle).get();
        auto second = DurationResolver::resolve(handle).get();
        QVERIFY(first.isOk() && second.isOk());
        QCOMPARE(*first, *second);
        QCOMPARE(factory_->stats("b.mp4")->loads.load(), 1);
    }

    void testFailureIsAssetLoad() {
        MediaAssetHandle handle(MediaSource::fromUri("broken.mp4", MediaKind::Video), factory_);
        auto d = DurationResolver::resolve(handle).get();
        QVERIFY(d.isErr());
        QVERIFY(d.error().code == ErrorCode::AssetLoad);
        QVERIFY(d.error().message.find("moov atom") != std::string::npos);
        QVERIFY(!d.error().asset.empty());

        // The failure is cached too
        auto again = handle.load();
        QVERIFY(again.isErr());
        QCOMPARE(factory_->stats("broken.mp4")->loads.load(), 1);
    }

    void testResolveAll() {
        MediaAssetHandle a(MediaSource::fromUri("a.wav", MediaKind::Audio), factory_);
        MediaAssetHandle b(MediaSource::fromUri("b.mp4", MediaKind::Video), factory_);

        auto all = DurationResolver::resolveAll({&a, &b});
        QVERIFY(all.isOk());
        QCOMPARE(all->size(), size_t(2));
        QCOMPARE((*all)[0], 1.5);
        QCOMPARE((*all)[1], 4.25);
    }

    void testResolveAllStopsOnFailure() {
        MediaAssetHandle a(MediaSource::fromUri("a.wav", MediaKind::Audio), factory_);
        MediaAssetHandle bad(MediaSource::fromUri("broken.mp4", MediaKind::Video), factory_);

        auto all = DurationResolver::resolveAll({&a, &bad});
        QVERIFY(all.isErr());
        QVERIFY(all.error().code == ErrorCode::AssetLoad);
        // Every probe ran to completion before returning
        QVERIFY(a.isLoaded());
    }

    void testCloneIsIndependent() {
        MediaAssetHandle a(MediaSource::fromUri("a.wav", MediaKind::Audio), factory_);
        QVERIFY(a.load().isOk());
        QVERIFY(a.markWired().isOk());

        auto copy = a.clone();
        QVERIFY(!copy->isLoaded());
        QVERIFY(!copy->isWired());
        QVERIFY(&copy->element() != &a.element());
        QCOMPARE(copy->source().uri(), std::string("a.wav"));

        auto rewired = a.markWired();
        QVERIFY(rewired.isErr());
        QVERIFY(rewired.error().code == ErrorCode::Programming);
    }

private:
    std::shared_ptr<FakeMediaFactory> factory_;
};

int runTestDurationResolver(int argc, char** argv) {
    TestDurationResolver tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_DurationResolver.moc"
