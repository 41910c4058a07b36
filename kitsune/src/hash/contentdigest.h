#ifndef CONTENTDIGEST_H
#define CONTENTDIGEST_H

#include <QString>
#include <QMetaType>

/**
 * @brief Fingerprint of a file's bytes
 *
 * ed2k, md5 are 32 lowercase hex characters, sha1 is 40, crc32 is 8
 * (zero padded). Built once by MultiHashCalculator and never modified.
 */
class ContentDigest
{
public:
    ContentDigest();
    ContentDigest(const QString& ed2k, const QString& sha1, const QString& md5,
                  const QString& crc32, qint64 sizeBytes);

    QString ed2k() const { return m_ed2k; }
    QString sha1() const { return m_sha1; }
    QString md5() const { return m_md5; }
    QString crc32() const { return m_crc32; }
    qint64 sizeBytes() const { return m_sizeBytes; }

    bool isValid() const { return m_ed2k.length() == 32; }

    QString ed2kLink(const QString& fileName) const;

    bool operator==(const ContentDigest& other) const;
    bool operator!=(const ContentDigest& other) const { return !(*this == other); }

private:
    QString m_ed2k;
    QString m_sha1;
    QString m_md5;
    QString m_crc32;
    qint64 m_sizeBytes;
};

Q_DECLARE_METATYPE(ContentDigest)

#endif // CONTENTDIGEST_H
