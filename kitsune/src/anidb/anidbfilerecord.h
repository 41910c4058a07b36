#ifndef ANIDBFILERECORD_H
#define ANIDBFILERECORD_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QPair>
#include <QMetaType>

/**
 * @brief Read-only result of a 220 FILE reply
 *
 * The payload is pipe-delimited and positional: field i is named by
 * FileMask::fieldNames(fmask, amask)[i] for the masks the request was sent
 * with. Fields the reply does not carry (short payload, truncated datagram)
 * are present with an empty value.
 *
 * Usage:
 *   AniDBFileRecord record = AniDBFileRecord::fromPayload(names, payload);
 *   int aid = record.animeId();
 *   QString title = record.value("anime_name_romaji");
 */
class AniDBFileRecord
{
public:
    AniDBFileRecord();

    /**
     * @param names field names in payload order
     * @param payload the pipe-delimited reply body
     * @param truncated the reply datagram was cut at the size limit
     */
    static AniDBFileRecord fromPayload(const QStringList &names, const QString &payload, bool truncated = false);

    bool isEmpty() const { return m_fields.isEmpty(); }
    int fieldCount() const { return m_fields.size(); }
    QStringList fieldNames() const;

    // (name, value) pairs in payload order
    QList<QPair<QString, QString>> fields() const { return m_fields; }

    bool contains(const QString &name) const;

    // Empty when the field was not requested or not delivered
    QString value(const QString &name) const;
    QString valueAt(int index) const;

    // The datagram hit the size limit; the last fields may be cut or missing
    bool isTruncated() const { return m_truncated; }

    // IDs
    int fileId() const { return intValue("fid"); }
    int animeId() const { return intValue("aid"); }
    int episodeId() const { return intValue("eid"); }
    int groupId() const { return intValue("gid"); }
    int mylistId() const { return intValue("lid"); }

    // File properties
    qint64 size() const;
    QString ed2kHash() const { return value("ed2k"); }
    QString md5Hash() const { return value("md5"); }
    QString sha1Hash() const { return value("sha1"); }
    QString crc32() const { return value("crc32"); }
    QString filename() const { return value("filename"); }
    bool isDeprecated() const { return value("isdepr") == QLatin1String("1"); }

    // Anime, episode and group
    QString animeNameRomaji() const { return value("anime_name_romaji"); }
    QString animeNameKanji() const { return value("anime_name_kanji"); }
    QString animeNameEnglish() const { return value("anime_name_english"); }
    QString episodeNumber() const { return value("epno"); }
    QString episodeName() const { return value("ep_name"); }
    QString episodeNameRomaji() const { return value("ep_name_romaji"); }
    QString episodeNameKanji() const { return value("ep_name_kanji"); }
    QString groupName() const { return value("group_name"); }
    QString groupNameShort() const { return value("group_name_short"); }

private:
    int intValue(const QString &name) const;

    QList<QPair<QString, QString>> m_fields;
    bool m_truncated;
};

Q_DECLARE_METATYPE(AniDBFileRecord)

#endif // ANIDBFILERECORD_H
