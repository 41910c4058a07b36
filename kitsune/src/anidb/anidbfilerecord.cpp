#include "anidbfilerecord.h"
#include "../logger.h"

AniDBFileRecord::AniDBFileRecord()
    : m_truncated(false)
{
}

AniDBFileRecord AniDBFileRecord::fromPayload(const QStringList &names, const QString &payload, bool truncated)
{
    AniDBFileRecord record;
    record.m_truncated = truncated;

    const QStringList tokens = payload.split(QLatin1Char('|'));

    for (int i = 0; i < names.size(); ++i)
    {
        record.m_fields.append(qMakePair(names.at(i), i < tokens.size() ? tokens.at(i) : QString()));
    }

    if (tokens.size() < names.size())
    {
        LOG(QString("[AniDB File] Reply carries %1 of %2 requested fields%3")
            .arg(tokens.size()).arg(names.size())
            .arg(truncated ? QStringLiteral(" (truncated)") : QString()));
    }
    else if (tokens.size() > names.size())
    {
        LOG(QString("[AniDB File] Ignoring %1 unexpected trailing fields").arg(tokens.size() - names.size()));
    }

    return record;
}

QStringList AniDBFileRecord::fieldNames() const
{
    QStringList names;
    for (const auto &field : m_fields)
    {
        names << field.first;
    }
    return names;
}

bool AniDBFileRecord::contains(const QString &name) const
{
    for (const auto &field : m_fields)
    {
        if (field.first == name)
        {
            return true;
        }
    }
    return false;
}

QString AniDBFileRecord::value(const QString &name) const
{
    for (const auto &field : m_fields)
    {
        if (field.first == name)
        {
            return field.second;
        }
    }
    return QString();
}

QString AniDBFileRecord::valueAt(int index) const
{
    if (index < 0 || index >= m_fields.size())
    {
        return QString();
    }
    return m_fields.at(index).second;
}

qint64 AniDBFileRecord::size() const
{
    bool ok = false;
    const qint64 result = value("size").toLongLong(&ok);
    return ok ? result : 0;
}

int AniDBFileRecord::intValue(const QString &name) const
{
    bool ok = false;
    const int result = value(name).toInt(&ok);
    return ok ? result : 0;
}
