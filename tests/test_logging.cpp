#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

using namespace officebridge;

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testLogEventWrites();
    void testDebugSuppressedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testRotationAtSizeLimit();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
    QList<nlohmann::json> readLines(const QString &path) const;
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

void LoggingTests::init()
{
    QFile::remove(logPath(QStringLiteral(".log")));
    QFile::remove(logPath(QStringLiteral("-trace.log")));
    QFile::remove(logPath(QStringLiteral(".log.1")));
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.office-local-bridge/logs/office-bridge-test" + suffix;
}

QList<nlohmann::json> LoggingTests::readLines(const QString &path) const
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.append(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::testLogEventWrites()
{
    logging::initLogging(QStringLiteral("office-bridge-test"), false);
    QCOMPARE(logging::logsDirPath(), m_tempDir.path() + "/.office-local-bridge/logs");

    logging::logEvent(logging::LogLevel::Info,
                      QStringLiteral("office-bridge-test"),
                      QStringLiteral("Test"),
                      QStringLiteral("testLogEventWrites"),
                      QStringLiteral("test_log"),
                      QStringLiteral("unit_test"),
                      QStringLiteral("direct_call"),
                      logging::defaultWho(),
                      QStringLiteral("corr-1"),
                      nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    const auto &parsed = lines.first();
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
    QVERIFY(!QFile::exists(logPath(QStringLiteral("-trace.log"))));
}

void LoggingTests::testDebugSuppressedWithoutTrace()
{
    logging::initLogging(QStringLiteral("office-bridge-test"), false);
    QVERIFY(!logging::isTraceEnabled());

    OBLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugSuppressedWithoutTrace"),
                QStringLiteral("debug_event"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                logging::defaultWho(),
                QString(),
                nlohmann::json::object());
    OBLOG_WARN(QStringLiteral("Test"),
               QStringLiteral("testDebugSuppressedWithoutTrace"),
               QStringLiteral("warn_event"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("what", "")), QStringLiteral("warn_event"));
    QCOMPARE(QString::fromStdString(lines.first().value("process", "")),
             QStringLiteral("office-bridge-test"));
}

void LoggingTests::testTraceWrites()
{
    logging::initLogging(QStringLiteral("office-bridge-test"), true);

    logging::logEvent(logging::LogLevel::Debug,
                      QStringLiteral("office-bridge-test"),
                      QStringLiteral("Test"),
                      QStringLiteral("testTraceWrites"),
                      QStringLiteral("test_trace"),
                      QStringLiteral("unit_test"),
                      QStringLiteral("direct_call"),
                      logging::defaultWho(),
                      QStringLiteral("corr-2"),
                      nlohmann::json::object());

    QCOMPARE(readLines(logPath(QStringLiteral("-trace.log"))).size(), 1);
    QCOMPARE(readLines(logPath(QStringLiteral(".log"))).size(), 1);
    logging::initLogging(QStringLiteral("office-bridge-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    logging::initLogging(QStringLiteral("office-bridge-test"), false);
    QVERIFY(logging::currentCorrelationId().isEmpty());
    {
        logging::CorrelationScope scope(QStringLiteral("corr-scope"));
        QCOMPARE(logging::currentCorrelationId(), QStringLiteral("corr-scope"));
        OBLOG_INFO(QStringLiteral("Test"),
                   QStringLiteral("testCorrelationScope"),
                   QStringLiteral("scoped_event"),
                   QStringLiteral("unit_test"),
                   QStringLiteral("macro"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    QVERIFY(logging::currentCorrelationId().isEmpty());

    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("corr", "")), QStringLiteral("corr-scope"));
}

void LoggingTests::testRotationAtSizeLimit()
{
    logging::initLogging(QStringLiteral("office-bridge-test"), false);
    QVERIFY(QDir().mkpath(logging::logsDirPath()));

    QFile full(logPath(QStringLiteral(".log")));
    QVERIFY(full.open(QIODevice::WriteOnly));
    QVERIFY(full.write(QByteArray(logging::kMaxLogFileBytes - 10, 'x')) > 0);
    full.close();

    OBLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testRotationAtSizeLimit"),
               QStringLiteral("after_rotation"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QCOMPARE(QFileInfo(logPath(QStringLiteral(".log.1"))).size(),
             logging::kMaxLogFileBytes - 10);
    const auto lines = readLines(logPath(QStringLiteral(".log")));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.first().value("what", "")),
             QStringLiteral("after_rotation"));
}

QTEST_GUILESS_MAIN(LoggingTests)
#include "test_logging.moc"
