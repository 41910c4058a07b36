#include "errors.h"

static QString hashErrorPrefix(HashError::Kind kind)
{
    switch (kind)
    {
    case HashError::FileNotFound:
        return QStringLiteral("File not found");
    case HashError::ReadError:
        return QStringLiteral("Read error");
    case HashError::Cancelled:
        return QStringLiteral("Hashing cancelled");
    }
    return QStringLiteral("Hash error");
}

HashError::HashError(Kind kind, const QString& path, const QString& detail)
    : m_kind(kind)
    , m_path(path)
{
    m_message = QString("%1: %2").arg(hashErrorPrefix(kind), path);
    if (!detail.isEmpty())
    {
        m_message += QString(" (%1)").arg(detail);
    }
    m_what = m_message.toUtf8();
}

AniDBError::AniDBError(Kind kind, const QString& message, const QString& code)
    : m_kind(kind)
    , m_code(code)
    , m_message(message)
{
    if (m_code.isEmpty())
    {
        m_what = QString("AniDB %1 error: %2").arg(kindName(kind), message).toUtf8();
    }
    else
    {
        m_what = QString("AniDB %1 error %2: %3").arg(kindName(kind), m_code, message).toUtf8();
    }
}

QString AniDBError::kindName(Kind kind)
{
    switch (kind)
    {
    case Transport:      return QStringLiteral("transport");
    case Timeout:        return QStringLiteral("timeout");
    case Auth:           return QStringLiteral("authentication");
    case SessionExpired: return QStringLiteral("session");
    case Banned:         return QStringLiteral("ban");
    case Protocol:       return QStringLiteral("protocol");
    }
    return QStringLiteral("unknown");
}

AniDBTimeoutError::AniDBTimeoutError(const QString& command, const QString& tag, int timeoutMs)
    : AniDBError(Timeout, QString("%1 (tag %2) got no reply within %3 ms").arg(command, tag).arg(timeoutMs))
    , m_command(command)
    , m_tag(tag)
{
}

AniDBBannedError::AniDBBannedError(const QString& reason, qint64 expiresAtMs)
    : AniDBError(Banned, reason.isEmpty() ? QStringLiteral("client is banned") : QString("client is banned: %1").arg(reason), QStringLiteral("555"))
    , m_reason(reason)
    , m_expiresAtMs(expiresAtMs)
{
}
