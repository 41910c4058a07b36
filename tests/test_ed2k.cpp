#include <QtTest/QtTest>
#include <QTemporaryFile>
#include <QTemporaryDir>
#include <QFile>
#include <QCryptographicHash>
#include "hash/ed2khasher.h"
#include "errors.h"

class TestEd2k : public QObject
{
    Q_OBJECT

private slots:
    // Known vectors
    void testEmptyInput();
    void testQuickBrownFox();
    void testEmptyFile();

    // Chunking
    void testUpdateGranularityDoesNotMatter();
    void testExactlyOneChunk();
    void testOneChunkPlusOneByte();
    void testExactMultipleOfChunks();
    void testLargeSparseFile();

    // Entry points
    void testSyncAndAsyncAgree();
    void testProgressCallback();
    void testEd2kLink();

    // Failures
    void testMissingFile();
    void testDirectoryIsNotAFile();
    void testAsyncMissingFile();
    void testStopCancelsHashing();

private:
    static QString writeFile(QTemporaryFile &file, const QByteArray &data);
    static QByteArray md4(const QByteArray &data);
};

QString TestEd2k::writeFile(QTemporaryFile &file, const QByteArray &data)
{
    if (!file.open())
        return QString();
    file.write(data);
    file.close();
    return file.fileName();
}

QByteArray TestEd2k::md4(const QByteArray &data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Md4);
}

// ===== Known vectors =====

void TestEd2k::testEmptyInput()
{
    QCOMPARE(Ed2kHasher::hashBytes(QByteArray()), QString("31d6cfe0d16ae931b73c59d7e0c089c0"));
}

void TestEd2k::testQuickBrownFox()
{
    QCOMPARE(Ed2kHasher::hashBytes("The quick brown fox jumps over the lazy dog"),
             QString("1bee69a46ba811185c194762abaeae90"));
}

void TestEd2k::testEmptyFile()
{
    QTemporaryFile tempFile;
    const QString path = writeFile(tempFile, QByteArray());
    QVERIFY(!path.isEmpty());

    Ed2kHasher hasher;
    QCOMPARE(hasher.computeContentHashSync(path), QString("31d6cfe0d16ae931b73c59d7e0c089c0"));
}

// ===== Chunking =====

void TestEd2k::testUpdateGranularityDoesNotMatter()
{
    QByteArray data(Ed2kHasher::CHUNK_SIZE + 12345, Qt::Uninitialized);
    for (int i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>((i * 31) & 0xff);

    const QString oneShot = Ed2kHasher::hashBytes(data);

    // Odd-sized pieces that straddle the chunk boundary
    Ed2kHasher hasher;
    hasher.init();
    qint64 offset = 0;
    const qint64 step = 777777;
    while (offset < data.size())
    {
        const qint64 n = qMin(step, data.size() - offset);
        hasher.update(data.constData() + offset, n);
        offset += n;
    }
    hasher.final();

    QCOMPARE(hasher.hexDigest(), oneShot);
    QCOMPARE(hasher.chunksCompleted(), 1);
}

void TestEd2k::testExactlyOneChunk()
{
    const QByteArray data(Ed2kHasher::CHUNK_SIZE, 'x');

    // Direct branch: MD4 of the bytes themselves
    QCOMPARE(Ed2kHasher::hashBytes(data), QString::fromLatin1(md4(data).toHex()));
}

void TestEd2k::testOneChunkPlusOneByte()
{
    const QByteArray chunk(Ed2kHasher::CHUNK_SIZE, 'x');
    const QByteArray data = chunk + QByteArray(1, 'x');

    // Hash-of-hashes branch
    const QByteArray expected = md4(md4(chunk) + md4(QByteArray(1, 'x')));
    const QString digest = Ed2kHasher::hashBytes(data);

    QCOMPARE(digest, QString::fromLatin1(expected.toHex()));
    QVERIFY(digest != Ed2kHasher::hashBytes(chunk));
}

void TestEd2k::testExactMultipleOfChunks()
{
    const QByteArray first(Ed2kHasher::CHUNK_SIZE, 'a');
    const QByteArray second(Ed2kHasher::CHUNK_SIZE, 'b');

    // No trailing empty-chunk digest
    const QByteArray expected = md4(md4(first) + md4(second));
    QCOMPARE(Ed2kHasher::hashBytes(first + second), QString::fromLatin1(expected.toHex()));
}

void TestEd2k::testLargeSparseFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("sparse.bin");

    // Ten chunks plus a tail, mostly holes
    const qint64 size = Ed2kHasher::CHUNK_SIZE * 10 + 4321;
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    QVERIFY(file.resize(size));
    QVERIFY(file.seek(Ed2kHasher::CHUNK_SIZE * 3 + 5));
    file.write("marker");
    file.close();

    QByteArray chunkDigests;
    const QByteArray zeroChunk(Ed2kHasher::CHUNK_SIZE, '\0');
    for (int i = 0; i < 10; ++i)
    {
        QByteArray chunk = zeroChunk;
        if (i == 3)
            chunk.replace(5, 6, "marker");
        chunkDigests += md4(chunk);
    }
    chunkDigests += md4(QByteArray(4321, '\0'));

    Ed2kHasher hasher;
    QCOMPARE(hasher.computeContentHashSync(path), QString::fromLatin1(md4(chunkDigests).toHex()));
    QCOMPARE(hasher.chunksCompleted(), 10);
}

// ===== Entry points =====

void TestEd2k::testSyncAndAsyncAgree()
{
    QByteArray data(3 * 1024 * 1024 + 17, Qt::Uninitialized);
    for (int i = 0; i < data.size(); ++i)
        data[i] = static_cast<char>(i % 251);

    QTemporaryFile tempFile;
    const QString path = writeFile(tempFile, data);
    QVERIFY(!path.isEmpty());

    Ed2kHasher hasher;
    const QString syncDigest = hasher.computeContentHashSync(path);
    const QString secondRun = hasher.computeContentHashSync(path);

    QFuture<QString> future = Ed2kHasher::computeContentHash(path);
    future.waitForFinished();

    QCOMPARE(secondRun, syncDigest);
    QCOMPARE(future.result(), syncDigest);
    QCOMPARE(syncDigest, Ed2kHasher::hashBytes(data));
}

void TestEd2k::testProgressCallback()
{
    QTemporaryFile tempFile;
    const QString path = writeFile(tempFile, QByteArray(FileStreamer::PART_SIZE * 3 + 1, 'p'));
    QVERIFY(!path.isEmpty());

    int lastTotal = 0;
    int lastDone = 0;
    int calls = 0;

    Ed2kHasher hasher;
    hasher.setProgressCallback([&](int total, int done)
    {
        lastTotal = total;
        lastDone = done;
        ++calls;
    });
    hasher.computeContentHashSync(path);

    QCOMPARE(lastTotal, 4);
    QCOMPARE(lastDone, 4);
    QCOMPARE(calls, 4);
}

void TestEd2k::testEd2kLink()
{
    QCOMPARE(Ed2kHasher::ed2kLink("episode 01.mkv", 43, "1bee69a46ba811185c194762abaeae90"),
             QString("ed2k://|file|episode 01.mkv|43|1bee69a46ba811185c194762abaeae90|/"));
}

// ===== Failures =====

void TestEd2k::testMissingFile()
{
    Ed2kHasher hasher;
    try
    {
        hasher.computeContentHashSync("/nonexistent/kitsune/file.mkv");
        QFAIL("expected HashError");
    }
    catch (const HashError &e)
    {
        QCOMPARE(e.kind(), HashError::FileNotFound);
        QCOMPARE(e.path(), QString("/nonexistent/kitsune/file.mkv"));
    }
}

void TestEd2k::testDirectoryIsNotAFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    Ed2kHasher hasher;
    try
    {
        hasher.computeContentHashSync(dir.path());
        QFAIL("expected HashError");
    }
    catch (const HashError &e)
    {
        QCOMPARE(e.kind(), HashError::FileNotFound);
    }
}

void TestEd2k::testAsyncMissingFile()
{
    QFuture<QString> future = Ed2kHasher::computeContentHash("/nonexistent/kitsune/async.mkv");
    try
    {
        future.waitForFinished();
        QFAIL("expected HashError");
    }
    catch (const HashError &e)
    {
        QCOMPARE(e.kind(), HashError::FileNotFound);
    }
}

void TestEd2k::testStopCancelsHashing()
{
    QTemporaryFile tempFile;
    const QString path = writeFile(tempFile, QByteArray(FileStreamer::PART_SIZE * 8, 's'));
    QVERIFY(!path.isEmpty());

    Ed2kHasher hasher;
    hasher.setProgressCallback([&hasher](int, int done)
    {
        if (done == 2)
            hasher.stop();
    });

    try
    {
        hasher.computeContentHashSync(path);
        QFAIL("expected HashError");
    }
    catch (const HashError &e)
    {
        QCOMPARE(e.kind(), HashError::Cancelled);
    }
}

QTEST_MAIN(TestEd2k)
#include "test_ed2k.moc"
