#include "banguard.h"
#include "../clock.h"
#include "../logger.h"
#include <QDateTime>

BanGuard::BanGuard(const Clock *clock, qint64 cooldownMs)
    : m_clock(clock)
    , m_cooldownMs(cooldownMs)
    , m_banned(false)
    , m_expiresAtMs(0)
{
}

void BanGuard::markBanned(const QString &reason)
{
    m_banned = true;
    m_reason = reason;
    m_expiresAtMs = m_clock->nowMs() + m_cooldownMs;
    LOG(QString("[AniDB Ban] Client banned (%1), blocking sends until %2")
        .arg(reason.isEmpty() ? QStringLiteral("no reason given") : reason,
             QDateTime::fromMSecsSinceEpoch(m_expiresAtMs).toString(Qt::ISODate)));
}

bool BanGuard::isBanned()
{
    if (m_banned && m_clock->nowMs() >= m_expiresAtMs)
    {
        LOG("[AniDB Ban] Ban cooldown elapsed, sends allowed again");
        clear();
    }
    return m_banned;
}

void BanGuard::clear()
{
    m_banned = false;
    m_expiresAtMs = 0;
    m_reason.clear();
}
