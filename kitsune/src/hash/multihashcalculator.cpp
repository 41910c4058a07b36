#include "multihashcalculator.h"
#include "ed2khasher.h"
#include "filestreamer.h"
#include "../logger.h"
#include <QFileInfo>
#include <QtConcurrent/QtConcurrentRun>
#include <zlib.h>

MultiHashCalculator::MultiHashCalculator()
    : m_sha1(QCryptographicHash::Sha1)
    , m_md5(QCryptographicHash::Md5)
    , m_crc(0)
    , m_size(0)
{
    init();
}

void MultiHashCalculator::init()
{
    m_sha1.reset();
    m_md5.reset();
    m_crc = static_cast<quint32>(crc32(0L, Z_NULL, 0));
    m_size = 0;
}

void MultiHashCalculator::update(const char *data, qint64 length)
{
    const QByteArray view = QByteArray::fromRawData(data, static_cast<int>(length));
    m_sha1.addData(view);
    m_md5.addData(view);
    m_crc = static_cast<quint32>(crc32(m_crc, reinterpret_cast<const Bytef *>(data), static_cast<uInt>(length)));
    m_size += length;
}

MultiHashCalculator::Result MultiHashCalculator::final()
{
    Result result;
    result.sha1 = QString::fromLatin1(m_sha1.result().toHex());
    result.md5 = QString::fromLatin1(m_md5.result().toHex());
    result.crc32 = formatCrc32(m_crc);
    result.sizeBytes = m_size;
    return result;
}

QString MultiHashCalculator::formatCrc32(quint32 crc)
{
    return QString("%1").arg(crc, 8, 16, QChar('0'));
}

MultiHashCalculator::Result MultiHashCalculator::computeSync(const QString &filepath)
{
    MultiHashCalculator calculator;
    FileStreamer::stream(filepath, [&calculator](const char *data, qint64 length)
    {
        calculator.update(data, length);
    });
    return calculator.final();
}

QFuture<MultiHashCalculator::Result> MultiHashCalculator::compute(const QString &filepath)
{
    return QtConcurrent::run([filepath]() { return computeSync(filepath); });
}

ContentDigest MultiHashCalculator::computeContentDigestSync(const QString &filepath)
{
    Ed2kHasher ed2k;
    MultiHashCalculator calculator;
    ed2k.init();

    FileStreamer::stream(filepath, [&ed2k, &calculator](const char *data, qint64 length)
    {
        ed2k.update(data, length);
        calculator.update(data, length);
    });

    ed2k.final();
    const Result aux = calculator.final();
    LOG(QString("[Hasher] %1: ed2k=%2 sha1=%3 md5=%4 crc32=%5")
        .arg(QFileInfo(filepath).fileName(), ed2k.hexDigest(), aux.sha1, aux.md5, aux.crc32));
    return ContentDigest(ed2k.hexDigest(), aux.sha1, aux.md5, aux.crc32, aux.sizeBytes);
}

QFuture<ContentDigest> MultiHashCalculator::computeContentDigest(const QString &filepath)
{
    return QtConcurrent::run([filepath]() { return computeContentDigestSync(filepath); });
}
