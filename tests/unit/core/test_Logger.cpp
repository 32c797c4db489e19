#include <QtTest>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        oc::Logger::shutdown();
    }

    void testInitialization() {
        oc::Logger::init("test_app", true);
        QVERIFY(oc::Logger::get() != nullptr);
        QVERIFY(oc::Logger::get()->level() == spdlog::level::debug);

        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        oc::Logger::shutdown();
    }

    void testDoubleInit() {
        oc::Logger::init("test_app", true);
        oc::Logger::init("test_app", true);
        QVERIFY(oc::Logger::get() != nullptr);
        oc::Logger::shutdown();
    }

    void testSetDebugTogglesLevel() {
        oc::Logger::init("test_app", false);
        QVERIFY(oc::Logger::get()->level() == spdlog::level::info);
        oc::Logger::setDebug(true);
        QVERIFY(oc::Logger::get()->level() == spdlog::level::debug);
        oc::Logger::shutdown();
    }

    void testGetInitializesLazily() {
        oc::Logger::shutdown();
        QVERIFY(oc::Logger::get() != nullptr);
        LOG_INFO("Logged without explicit init");
        oc::Logger::shutdown();
    }
};

QTEST_GUILESS_MAIN(TestLogger)
#include "test_Logger.moc"
