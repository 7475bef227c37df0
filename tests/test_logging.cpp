#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QByteArray lastLine(const QString &path) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/buildprof/logs/buildprof-test" + suffix;
}

QByteArray LoggingTests::lastLine(const QString &path) const
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    const QList<QByteArray> lines = file.readAll().trimmed().split('\n');
    return lines.isEmpty() ? QByteArray() : lines.last();
}

void LoggingTests::testLogEventWrites()
{
    buildprof::logging::initLogging(QStringLiteral("buildprof-test"), false);
    QCOMPARE(buildprof::logging::logsDirPath(),
             m_tempDir.path() + "/.local/share/buildprof/logs");

    buildprof::logging::logEvent(buildprof::logging::LogLevel::Info,
                                 QStringLiteral("buildprof-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 buildprof::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const QByteArray line = lastLine(logPath(QStringLiteral(".log")));
    QVERIFY(!line.isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")),
             QStringLiteral("value"));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    buildprof::logging::initLogging(QStringLiteral("buildprof-test"), false);
    QVERIFY(!buildprof::logging::isTraceEnabled());

    buildprof::logging::logEvent(buildprof::logging::LogLevel::Debug,
                                 QStringLiteral("buildprof-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testDebugSuppressedWithoutTrace"),
                                 QStringLiteral("hidden_debug"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 buildprof::logging::defaultWho(),
                                 QString(),
                                 nlohmann::json::object());

    QVERIFY(!lastLine(logPath(QStringLiteral(".log"))).contains("hidden_debug"));
}

void LoggingTests::testTraceWrites()
{
    buildprof::logging::initLogging(QStringLiteral("buildprof-test"), true);

    buildprof::logging::logEvent(buildprof::logging::LogLevel::Debug,
                                 QStringLiteral("buildprof-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testTraceWrites"),
                                 QStringLiteral("test_trace"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 buildprof::logging::defaultWho(),
                                 QStringLiteral("corr-2"),
                                 nlohmann::json::object());

    QVERIFY(lastLine(logPath(QStringLiteral("-trace.log"))).contains("test_trace"));
    QVERIFY(lastLine(logPath(QStringLiteral(".log"))).contains("test_trace"));
}

void LoggingTests::testCorrelationScope()
{
    buildprof::logging::initLogging(QStringLiteral("buildprof-test"), false);
    buildprof::logging::setCorrelationId(QString());

    {
        buildprof::logging::CorrelationScope scope(QStringLiteral("run-123"));
        QCOMPARE(buildprof::logging::currentCorrelationId(), QStringLiteral("run-123"));

        BPLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   buildprof::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QVERIFY(buildprof::logging::currentCorrelationId().isEmpty());

    const auto parsed = nlohmann::json::parse(
        lastLine(logPath(QStringLiteral(".log"))).toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("run-123"));
    QCOMPARE(QString::fromStdString(parsed.value("process", "")),
             QStringLiteral("buildprof-test"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
