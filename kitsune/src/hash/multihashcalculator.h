#ifndef MULTIHASHCALCULATOR_H
#define MULTIHASHCALCULATOR_H

#include <QString>
#include <QCryptographicHash>
#include <QFuture>
#include "contentdigest.h"

/**
 * @brief SHA-1, MD5 and CRC-32 over one byte stream
 *
 * CRC-32 is the standard reflected 0xEDB88320 polynomial with an all-ones
 * initial value and a final XOR with 0xFFFFFFFF, computed by zlib.
 *
 * The values are reported alongside the ED2K hash; they never go on the wire.
 */
class MultiHashCalculator
{
public:
    struct Result
    {
        QString sha1;
        QString md5;
        QString crc32;
        qint64 sizeBytes = 0;
    };

    MultiHashCalculator();

    void init();
    void update(const char *data, qint64 length);
    Result final();

    static Result computeSync(const QString &filepath);
    static QFuture<Result> compute(const QString &filepath);

    /**
     * @brief ED2K + SHA-1 + MD5 + CRC-32 in a single pass over the file
     * @throws HashError
     */
    static ContentDigest computeContentDigestSync(const QString &filepath);
    static QFuture<ContentDigest> computeContentDigest(const QString &filepath);

    static QString formatCrc32(quint32 crc);

private:
    QCryptographicHash m_sha1;
    QCryptographicHash m_md5;
    quint32 m_crc;
    qint64 m_size;
};

#endif // MULTIHASHCALCULATOR_H
