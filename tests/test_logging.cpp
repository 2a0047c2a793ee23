#include <QtTest>
#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/keywords/severity.hpp>
#include <boost/log/sources/record_ostream.hpp>

using boost::log::trivial::severity_level;

class TestLogging : public QObject {
    Q_OBJECT
private slots:
    void testParseLogLevel_data();
    void testParseLogLevel();
    void testInitLoggingFiltersBelowLevel();
};

void TestLogging::testParseLogLevel_data()
{
    QTest::addColumn<QString>("name");
    QTest::addColumn<int>("expected");

    QTest::newRow("trace")    << "trace"   << static_cast<int>(severity_level::trace);
    QTest::newRow("debug")    << "DEBUG"   << static_cast<int>(severity_level::debug);
    QTest::newRow("info")     << "info"    << static_cast<int>(severity_level::info);
    QTest::newRow("warn")     << "warn"    << static_cast<int>(severity_level::warning);
    QTest::newRow("warning")  << " warning " << static_cast<int>(severity_level::warning);
    QTest::newRow("error")    << "error"   << static_cast<int>(severity_level::error);
    QTest::newRow("fatal")    << "fatal"   << static_cast<int>(severity_level::fatal);
    QTest::newRow("unknown")  << "verbose" << static_cast<int>(severity_level::info);
    QTest::newRow("empty")    << ""        << static_cast<int>(severity_level::info);
}

void TestLogging::testParseLogLevel()
{
    QFETCH(QString, name);
    QFETCH(int, expected);
    QCOMPARE(static_cast<int>(pyro::parseLogLevel(name)), expected);
}

void TestLogging::testInitLoggingFiltersBelowLevel()
{
    pyro::initLogging("warning");

    boost::log::record debugRecord = boost::log::trivial::logger::get().open_record(
        boost::log::keywords::severity = severity_level::debug);
    QVERIFY(!debugRecord);

    boost::log::record errorRecord = boost::log::trivial::logger::get().open_record(
        boost::log::keywords::severity = severity_level::error);
    QVERIFY(static_cast<bool>(errorRecord));

    pyro::initLogging("info");
}

QTEST_MAIN(TestLogging)
#include "test_logging.moc"
