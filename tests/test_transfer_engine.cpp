/**
 * @file test_transfer_engine.cpp
 * @brief Tests for single-pack download, resume and retry behavior
 */

#include <QtTest>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "FakeTransport.h"
#include "packfetch/engine/FetchContext.h"
#include "packfetch/engine/TransferEngine.h"

using namespace PackFetch;
using namespace PackFetch::Testing;

class TestTransferEngine : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testFallsThroughToNextCandidate();
    void testAllCandidatesMissing();
    void testResumeSendsRange();
    void testServerIgnoringRangeRestarts();
    void testPartialAlreadyComplete();
    void testNoResumeStartsOver();
    void testRetryBudgetExhausted();
    void testMidTransferFailureKeepsPartial();
    void testUnknownLength();
    void testExistingFileSkipped();
    void testForceRefreshReplacesExistingFile();
    void testInterruptedBeforeStart();
    void testInterruptDuringBodyKeepsPartial();
    void testServerErrorThenSuccess();
    void testRangeNotSatisfiableDiscardsPartial();
    void testUncreatableDirectoryFails();
    void testUnopenablePartialFails();
    void testWriteErrorLeavesPartialInPlace();

private:
    FetchSettings settings() const;
    QString pathFor(const QString& fileName) const { return m_dir->filePath(fileName); }
    QString urlFor(PackId id, int scheme) const {
        return UrlResolver::candidates(id, m_baseUrl).at(static_cast<size_t>(scheme)).url;
    }
    void writePartial(const QString& fileName, const QByteArray& contents);
    static QByteArray readAll(const QString& path);

    std::unique_ptr<QTemporaryDir> m_dir;
    const QString m_baseUrl = QStringLiteral("http://fake.test");
};

void TestTransferEngine::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
}

void TestTransferEngine::cleanup()
{
    m_dir.reset();
}

FetchSettings TestTransferEngine::settings() const
{
    FetchSettings s;
    s.downloadDir = m_dir->path();
    s.baseUrl = m_baseUrl;
    s.backoffBase = Duration(1);
    s.maxBackoff = Duration(5);
    s.delay = false;
    s.showProgress = false;
    return s;
}

void TestTransferEngine::writePartial(const QString& fileName, const QByteArray& contents)
{
    QFile file(TransferEngine::partialPathFor(pathFor(fileName)));
    QVERIFY(file.open(QIODevice::WriteOnly));
    QCOMPARE(file.write(contents), qint64(contents.size()));
}

QByteArray TestTransferEngine::readAll(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return QByteArray();
    }
    return file.readAll();
}

void TestTransferEngine::testFallsThroughToNextCandidate()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(10000);
    server.serve(urlFor(1586, 2), resource);

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(1586);

    QVERIFY(result.succeeded());
    QCOMPARE(result.finalPath, pathFor("Beatmap Pack #1586.7z"));
    QCOMPARE(result.url, urlFor(1586, 2));
    QCOMPARE(readAll(result.finalPath), resource.body);
    QVERIFY(!QFile::exists(TransferEngine::partialPathFor(result.finalPath)));

    QCOMPARE(server.countFor("HEAD", urlFor(1586, 0)), 1);
    QCOMPARE(server.countFor("HEAD", urlFor(1586, 1)), 1);
    QCOMPARE(server.countFor("GET", urlFor(1586, 0)), 0);
    QCOMPARE(server.countFor("GET", urlFor(1586, 2)), 1);
    QCOMPARE(context.progress().activeCount(), size_t(0));
}

void TestTransferEngine::testAllCandidatesMissing()
{
    FakeServer server;
    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(9999999);

    QVERIFY(!result.succeeded());
    QVERIFY(result.status == TransferStatus::Failed);
    QVERIFY(result.category == ErrorCategory::NotFound);
    QCOMPARE(result.reason, QString("no matching URL pattern"));
    QCOMPARE(server.requests().size(), 3);
    QVERIFY(QDir(m_dir->path()).entryList(QDir::Files).isEmpty());
}

void TestTransferEngine::testResumeSendsRange()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(5000000);
    server.serve(urlFor(1586, 0), resource);

    writePartial("osu! Beatmap Pack #1586.zip", resource.body.left(1000000));

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(1586);

    QVERIFY(result.succeeded());
    QCOMPARE(result.bytesWritten, ByteCount(4000000));

    const QList<RecordedRequest> requests = server.requests();
    QCOMPARE(requests.size(), 2);
    QCOMPARE(requests[0].method, QString("HEAD"));
    QCOMPARE(requests[0].rangeStart, ByteOffset(0));
    QCOMPARE(requests[1].method, QString("GET"));
    QCOMPARE(requests[1].rangeStart, ByteOffset(1000000));

    const QByteArray written = readAll(pathFor("osu! Beatmap Pack #1586.zip"));
    QCOMPARE(written.size(), qsizetype(5000000));
    QVERIFY(written == resource.body);
}

void TestTransferEngine::testServerIgnoringRangeRestarts()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(8000);
    resource.honorRange = false;
    server.serve(urlFor(12, 0), resource);

    writePartial("osu! Beatmap Pack #12.zip", QByteArray(3000, 'x'));

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(12);

    QVERIFY(result.succeeded());
    QCOMPARE(readAll(result.finalPath), resource.body);
}

void TestTransferEngine::testPartialAlreadyComplete()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(4096);
    server.serve(urlFor(5, 0), resource);

    writePartial("osu! Beatmap Pack #5.zip", resource.body);

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(5);

    QVERIFY(result.succeeded());
    QCOMPARE(server.countFor("GET", urlFor(5, 0)), 0);
    QCOMPARE(readAll(pathFor("osu! Beatmap Pack #5.zip")), resource.body);
}

void TestTransferEngine::testNoResumeStartsOver()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(6000);
    server.serve(urlFor(8, 0), resource);

    writePartial("osu! Beatmap Pack #8.zip", resource.body.left(2000));

    FetchSettings s = settings();
    s.resume = false;
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(8);

    QVERIFY(result.succeeded());
    QCOMPARE(result.bytesWritten, ByteCount(6000));
    QCOMPARE(server.requests().last().rangeStart, ByteOffset(0));
    QCOMPARE(readAll(result.finalPath), resource.body);
}

void TestTransferEngine::testRetryBudgetExhausted()
{
    FakeServer server;
    FakeResource flaky;
    flaky.headStatus = 503;
    server.serve(urlFor(77, 0), flaky);

    FetchSettings s = settings();
    s.retryBudget = 2;
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(77);

    QVERIFY(!result.succeeded());
    // One initial attempt plus two retries, then the remaining candidates once each
    QCOMPARE(server.countFor("HEAD", urlFor(77, 0)), 3);
    QCOMPARE(server.countFor("HEAD", urlFor(77, 1)), 1);
    QCOMPARE(server.countFor("HEAD", urlFor(77, 2)), 1);
}

void TestTransferEngine::testMidTransferFailureKeepsPartial()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(20000);
    resource.failAfterBytes = 5000;
    server.serve(urlFor(31, 0), resource);

    FetchSettings s = settings();
    s.retryBudget = 1;
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(31);

    QVERIFY(!result.succeeded());

    const QString finalPath = pathFor("osu! Beatmap Pack #31.zip");
    QVERIFY(!QFile::exists(finalPath));

    const QByteArray partial = readAll(TransferEngine::partialPathFor(finalPath));
    QCOMPARE(partial.size(), qsizetype(10000));
    QVERIFY(partial == resource.body.left(10000));

    QList<ByteOffset> ranges;
    for (const RecordedRequest& request : server.requests()) {
        if (request.method == "GET") {
            ranges << request.rangeStart;
        }
    }
    QCOMPARE(ranges, QList<ByteOffset>({0, 5000}));

    // A later run picks up where the partial file stopped
    resource.failAfterBytes = -1;
    server.serve(urlFor(31, 0), resource);

    FetchContext rerunContext(s);
    TransferEngine rerun(rerunContext, transport);
    const TransferResult resumed = rerun.fetch(31);

    QVERIFY(resumed.succeeded());
    QCOMPARE(resumed.bytesWritten, ByteCount(10000));
    QCOMPARE(server.requests().last().rangeStart, ByteOffset(10000));
    QVERIFY(readAll(finalPath) == resource.body);
}

void TestTransferEngine::testUnknownLength()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(3000);
    resource.advertiseLength = false;
    server.serve(urlFor(44, 1), resource);

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(44);

    QVERIFY(result.succeeded());
    QCOMPARE(result.finalPath, pathFor("Beatmap Pack #44.zip"));
    QCOMPARE(readAll(result.finalPath), resource.body);
}

void TestTransferEngine::testExistingFileSkipped()
{
    QFile existing(pathFor("Beatmap Pack #3.zip"));
    QVERIFY(existing.open(QIODevice::WriteOnly));
    existing.close();

    FakeServer server;
    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(3);

    QVERIFY(result.succeeded());
    QCOMPARE(result.finalPath, pathFor("Beatmap Pack #3.zip"));
    QVERIFY(server.requests().isEmpty());
}

void TestTransferEngine::testForceRefreshReplacesExistingFile()
{
    QFile existing(pathFor("osu! Beatmap Pack #3.zip"));
    QVERIFY(existing.open(QIODevice::WriteOnly));
    existing.write("stale");
    existing.close();

    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(7000);
    server.serve(urlFor(3, 0), resource);

    FetchSettings s = settings();
    s.forceRefresh = true;
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(3);

    QVERIFY(result.succeeded());
    QCOMPARE(server.countFor("GET", urlFor(3, 0)), 1);
    QVERIFY(readAll(pathFor("osu! Beatmap Pack #3.zip")) == resource.body);
    QVERIFY(!QFile::exists(TransferEngine::partialPathFor(result.finalPath)));
}

void TestTransferEngine::testInterruptedBeforeStart()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(100);
    server.serve(urlFor(2, 0), resource);

    FetchContext context(settings());
    context.requestInterrupt();
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(2);

    QVERIFY(!result.succeeded());
    QVERIFY(result.category == ErrorCategory::Cancelled);
    QVERIFY(server.requests().isEmpty());
}

void TestTransferEngine::testInterruptDuringBodyKeepsPartial()
{
    FetchContext context(settings());

    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(20000);
    resource.afterChunk = [&context](qint64 delivered) {
        if (delivered >= 4096) {
            context.requestInterrupt();
        }
    };
    server.serve(urlFor(14, 0), resource);

    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(14);

    QVERIFY(!result.succeeded());
    QVERIFY(result.category == ErrorCategory::Cancelled);
    QCOMPARE(server.countFor("GET", urlFor(14, 0)), 1);

    const QString finalPath = pathFor("osu! Beatmap Pack #14.zip");
    QVERIFY(!QFile::exists(finalPath));

    // The chunk in flight when the flag was raised is still written
    const QByteArray partial = readAll(TransferEngine::partialPathFor(finalPath));
    QCOMPARE(partial.size(), qsizetype(8192));
    QVERIFY(partial == resource.body.left(8192));
}

void TestTransferEngine::testServerErrorThenSuccess()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(5000);
    resource.transientGetFailures = 1;
    server.serve(urlFor(15, 0), resource);

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(15);

    QVERIFY(result.succeeded());
    QCOMPARE(result.url, urlFor(15, 0));
    QCOMPARE(server.countFor("GET", urlFor(15, 0)), 2);
    QCOMPARE(server.countFor("HEAD", urlFor(15, 1)), 0);
    QVERIFY(readAll(result.finalPath) == resource.body);
}

void TestTransferEngine::testRangeNotSatisfiableDiscardsPartial()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(8000);
    resource.rangedStatus = 416;
    server.serve(urlFor(16, 0), resource);

    writePartial("osu! Beatmap Pack #16.zip", QByteArray(3000, 'x'));

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(16);

    QVERIFY(result.succeeded());
    QVERIFY(readAll(result.finalPath) == resource.body);

    QList<ByteOffset> ranges;
    for (const RecordedRequest& request : server.requests()) {
        if (request.method == "GET") {
            ranges << request.rangeStart;
        }
    }
    QCOMPARE(ranges, QList<ByteOffset>({3000, 0}));
}

void TestTransferEngine::testUncreatableDirectoryFails()
{
    QFile blocker(pathFor("blocker"));
    QVERIFY(blocker.open(QIODevice::WriteOnly));
    blocker.close();

    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(100);
    server.serve(urlFor(17, 0), resource);

    FetchSettings s = settings();
    s.downloadDir = pathFor("blocker/packs");
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(17);

    QVERIFY(!result.succeeded());
    QVERIFY(result.status == TransferStatus::Failed);
    QVERIFY(result.category == ErrorCategory::FileSystem);
    QVERIFY(server.requests().isEmpty());
}

void TestTransferEngine::testUnopenablePartialFails()
{
    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(12345);
    server.serve(urlFor(18, 0), resource);

    const QString finalPath = pathFor("osu! Beatmap Pack #18.zip");
    QVERIFY(QDir().mkpath(TransferEngine::partialPathFor(finalPath)));

    FetchSettings s = settings();
    s.resume = false;
    FetchContext context(s);
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(18);

    QVERIFY(!result.succeeded());
    QVERIFY(result.category == ErrorCategory::FileSystem);
    QCOMPARE(server.countFor("GET", urlFor(18, 0)), 1);
    QCOMPARE(server.countFor("HEAD", urlFor(18, 1)), 0);
    QVERIFY(!QFile::exists(finalPath));
    QVERIFY(QFileInfo(TransferEngine::partialPathFor(finalPath)).isDir());
}

void TestTransferEngine::testWriteErrorLeavesPartialInPlace()
{
    if (!QFileInfo::exists("/dev/full")) {
        QSKIP("/dev/full is not available");
    }

    FakeServer server;
    FakeResource resource;
    resource.body = patternBytes(40000);
    server.serve(urlFor(19, 0), resource);

    // Every write through the partial path fails with ENOSPC
    const QString finalPath = pathFor("osu! Beatmap Pack #19.zip");
    const QString partPath = TransferEngine::partialPathFor(finalPath);
    QVERIFY(QFile::link("/dev/full", partPath));

    FetchContext context(settings());
    FakeTransport transport(server);
    TransferEngine engine(context, transport);

    const TransferResult result = engine.fetch(19);

    QVERIFY(!result.succeeded());
    QVERIFY(result.category == ErrorCategory::FileSystem);
    QVERIFY(result.reason.startsWith("write failed"));
    QCOMPARE(server.countFor("GET", urlFor(19, 0)), 1);
    QVERIFY(!QFile::exists(finalPath));
    QVERIFY(QFileInfo(partPath).isSymLink());
}

QTEST_MAIN(TestTransferEngine)
#include "test_transfer_engine.moc"
