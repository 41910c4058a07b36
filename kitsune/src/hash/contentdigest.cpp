#include "contentdigest.h"
#include "ed2khasher.h"

ContentDigest::ContentDigest()
    : m_sizeBytes(0)
{
}

ContentDigest::ContentDigest(const QString& ed2k, const QString& sha1, const QString& md5,
                             const QString& crc32, qint64 sizeBytes)
    : m_ed2k(ed2k.toLower())
    , m_sha1(sha1.toLower())
    , m_md5(md5.toLower())
    , m_crc32(crc32.toLower())
    , m_sizeBytes(sizeBytes)
{
}

QString ContentDigest::ed2kLink(const QString& fileName) const
{
    return Ed2kHasher::ed2kLink(fileName, m_sizeBytes, m_ed2k);
}

bool ContentDigest::operator==(const ContentDigest& other) const
{
    return m_ed2k == other.m_ed2k
        && m_sha1 == other.m_sha1
        && m_md5 == other.m_md5
        && m_crc32 == other.m_crc32
        && m_sizeBytes == other.m_sizeBytes;
}
