/**
 * @file test_command_line.cpp
 * @brief Unit tests for option parsing and settings merging
 */

#include <QtTest>
#include <QRegularExpression>

#include "packfetch/app/CommandLine.h"

using namespace PackFetch;

class TestCommandLine : public QObject
{
    Q_OBJECT

private slots:
    void testRangeExpands();
    void testRangeAndListMerged();
    void testRetryFailedAddsPersisted();
    void testInvalidArguments_data();
    void testInvalidArguments();
    void testPersistedValuesUsedByDefault();
    void testCommandLineOverridesPersisted();
    void testLogLevelCaseInsensitive();
    void testHelpRequested();
    void testLogRecordFormat();

private:
    static QStringList args(const QStringList& rest) { return QStringList{"packfetch"} + rest; }
};

void TestCommandLine::testRangeExpands()
{
    CommandLine cli;
    QVERIFY(cli.parse(args({"--start", "3", "--end", "5"})));
    QCOMPARE(cli.requestedPacks(PersistedState{}), QList<PackId>({3, 4, 5}));
}

void TestCommandLine::testRangeAndListMerged()
{
    CommandLine cli;
    QVERIFY(cli.parse(args({"--start", "2", "--end", "3", "--packs", "7, 1,3"})));
    QCOMPARE(cli.requestedPacks(PersistedState{}), QList<PackId>({1, 2, 3, 7}));
}

void TestCommandLine::testRetryFailedAddsPersisted()
{
    PersistedState persisted;
    persisted.failed = {40, 12};

    CommandLine cli;
    QVERIFY(cli.parse(args({"--packs", "5", "--retry-failed"})));
    QCOMPARE(cli.requestedPacks(persisted), QList<PackId>({5, 12, 40}));

    CommandLine plain;
    QVERIFY(plain.parse(args({"--packs", "5"})));
    QCOMPARE(plain.requestedPacks(persisted), QList<PackId>({5}));
}

void TestCommandLine::testInvalidArguments_data()
{
    QTest::addColumn<QStringList>("arguments");
    QTest::addColumn<QString>("message");

    QTest::newRow("start after end") << QStringList{"--start", "9", "--end", "3"}
                                     << "Start number must be less than or equal to end number";
    QTest::newRow("start alone") << QStringList{"--start", "9"}
                                 << "--start and --end must be given together";
    QTest::newRow("zero pack") << QStringList{"--start", "0", "--end", "3"}
                               << "Pack numbers must be positive";
    QTest::newRow("non-integer pack") << QStringList{"--packs", "1,x"}
                                      << "Pack numbers must be integers, got 'x'";
    QTest::newRow("too many threads") << QStringList{"--threads", "33"}
                                      << "--threads must be between 1 and 32";
    QTest::newRow("zero threads") << QStringList{"--threads", "0"}
                                  << "--threads must be between 1 and 32";
    QTest::newRow("negative bandwidth") << QStringList{"--bandwidth-limit=-1"}
                                        << "--bandwidth-limit must be a non-negative number";
    QTest::newRow("zero timeout") << QStringList{"--timeout", "0"}
                                  << "--timeout must be at least 1 second";
    QTest::newRow("ftp base") << QStringList{"--base-url", "ftp://host"}
                              << "--base-url must be an http(s) URL";
    QTest::newRow("bad log level") << QStringList{"--log-level", "loud"}
                                   << "--log-level must be one of DEBUG, INFO, WARNING, ERROR";
    QTest::newRow("positional") << QStringList{"1586"}
                                << "Unexpected argument: 1586";
}

void TestCommandLine::testInvalidArguments()
{
    QFETCH(QStringList, arguments);
    QFETCH(QString, message);

    CommandLine cli;
    QVERIFY(!cli.parse(args(arguments)));
    QCOMPARE(cli.errorText(), message);
}

void TestCommandLine::testPersistedValuesUsedByDefault()
{
    PersistedState persisted;
    persisted.downloadDir = "/srv/packs";
    persisted.threads = 6;
    persisted.chunkSize = 32768;
    persisted.delay = false;

    CommandLine cli;
    QVERIFY(cli.parse(args({"--packs", "1"})));
    const FetchSettings s = cli.settings(persisted);

    QCOMPARE(s.downloadDir, QString("/srv/packs"));
    QCOMPARE(s.threads, 6);
    QCOMPARE(s.chunkSize, ByteCount(32768));
    QVERIFY(!s.delay);
    QVERIFY(s.resume);
    QVERIFY(!s.forceRefresh);
    QVERIFY(s.showProgress);
    QCOMPARE(s.bandwidthLimit, ByteCount(0));
    QCOMPARE(s.retryBudget, Constants::MAX_RETRIES);
    QCOMPARE(s.baseUrl, QString("https://packs.ppy.sh"));
}

void TestCommandLine::testCommandLineOverridesPersisted()
{
    PersistedState persisted;
    persisted.downloadDir = "/srv/packs";
    persisted.threads = 6;
    persisted.delay = true;

    CommandLine cli;
    QVERIFY(cli.parse(args({"--packs", "1", "--dir", "/tmp/out", "--threads", "2",
                            "--no-delay", "--no-resume", "--force", "--quiet",
                            "--bandwidth-limit", "1.5", "--timeout", "10",
                            "--retries", "5", "--backoff", "250",
                            "--base-url", "http://mirror.test/"})));
    const FetchSettings s = cli.settings(persisted);

    QCOMPARE(s.downloadDir, QString("/tmp/out"));
    QCOMPARE(s.threads, 2);
    QVERIFY(!s.delay);
    QVERIFY(!s.resume);
    QVERIFY(s.forceRefresh);
    QVERIFY(!s.showProgress);
    QCOMPARE(s.bandwidthLimit, ByteCount(1572864));
    QCOMPARE(s.connectTimeout.count(), Duration::rep(10000));
    QCOMPARE(s.readTimeout.count(), Duration::rep(10000));
    QCOMPARE(s.retryBudget, 5);
    QCOMPARE(s.backoffBase.count(), Duration::rep(250));
    QCOMPARE(s.baseUrl, QString("http://mirror.test/"));
}

void TestCommandLine::testLogLevelCaseInsensitive()
{
    CommandLine cli;
    QVERIFY(cli.parse(args({"--packs", "1", "--log-level", "debug", "--log-file", "x.log"})));
    QVERIFY(cli.options().logLevel == Logging::Level::Debug);
    QCOMPARE(cli.options().logFile, QString("x.log"));
    QCOMPARE(cli.options().configPath, QString("osu_downloader_config.json"));
}

void TestCommandLine::testHelpRequested()
{
    CommandLine cli;
    QVERIFY(cli.parse(args({"--help"})));
    QVERIFY(cli.helpRequested());
    QVERIFY(cli.helpText().contains("--retry-failed"));
}

void TestCommandLine::testLogRecordFormat()
{
    QVERIFY(Logging::levelFromString("Warning") == Logging::Level::Warning);
    QVERIFY(Logging::levelFromString(" error ") == Logging::Level::Error);
    QVERIFY(!Logging::levelFromString("verbose").has_value());
    QVERIFY(Logging::levelOf(QtCriticalMsg) == Logging::Level::Error);

    const QString record = Logging::formatRecord(QtInfoMsg, "BatchScheduler: Finished");
    const QRegularExpression pattern(
        R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO\] BatchScheduler: Finished$)");
    QVERIFY2(pattern.match(record).hasMatch(), qPrintable(record));
}

QTEST_MAIN(TestCommandLine)
#include "test_command_line.moc"
