#include "sessioninfo.h"

SessionInfo::SessionInfo()
    : m_createdAtMs(0)
    , m_expiresAtMs(0)
    , m_loggedIn(false)
{
}

SessionInfo::SessionInfo(const QString &sessionKey, qint64 createdAtMs, qint64 expiresAtMs)
    : m_sessionKey(sessionKey)
    , m_createdAtMs(createdAtMs)
    , m_expiresAtMs(expiresAtMs)
    , m_loggedIn(!sessionKey.isEmpty())
{
}

bool SessionInfo::isValid(qint64 nowMs) const
{
    return m_loggedIn && !m_sessionKey.isEmpty() && nowMs < m_expiresAtMs;
}

void SessionInfo::clear()
{
    m_sessionKey.clear();
    m_createdAtMs = 0;
    m_expiresAtMs = 0;
    m_loggedIn = false;
}
