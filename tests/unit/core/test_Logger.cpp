#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        rs::Logger::shutdown();
    }

    void testInitialization() {
        rs::Logger::init("reelsync_test", true);
        QVERIFY(rs::Logger::get() != nullptr);

        // Should not crash
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        rs::Logger::shutdown();
    }

    void testDoubleInit() {
        rs::Logger::init("reelsync_test", true);
        rs::Logger::init("reelsync_test", true);
        QVERIFY(rs::Logger::get() != nullptr);
        rs::Logger::shutdown();
    }

    void testGetWithoutInit() {
        rs::Logger::shutdown();
        // get() initializes lazily
        QVERIFY(rs::Logger::get() != nullptr);
        LOG_DEBUG("lazily initialized");
    }

    void testSetDebug() {
        rs::Logger::init("reelsync_test", false);
        rs::Logger::setDebug(true);
        QVERIFY(rs::Logger::get()->level() == spdlog::level::debug);
        rs::Logger::setDebug(false);
        QVERIFY(rs::Logger::get()->level() == spdlog::level::info);
        rs::Logger::shutdown();
    }
};

int runTestLogger(int argc, char** argv) {
    TestLogger tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "test_Logger.moc"
