#include "ratelimiter.h"
#include "../clock.h"
#include "../logger.h"
#include <QtGlobal>

RateLimiter::RateLimiter(const Clock *clock, int generalIntervalMs, int fileIntervalMs)
    : m_clock(clock)
    , m_generalIntervalMs(generalIntervalMs)
    , m_fileIntervalMs(fileIntervalMs)
    , m_lastGeneral(0)
    , m_lastFile(0)
    , m_hasGeneral(false)
    , m_hasFile(false)
    , m_bulkIntervalMs(30 * 60 * 1000)
    , m_bulkPauseMs(5 * 60 * 1000)
    , m_bulkStart(0)
{
}

void RateLimiter::setBulkPause(qint64 intervalMs, qint64 pauseMs)
{
    m_bulkIntervalMs = intervalMs;
    m_bulkPauseMs = pauseMs;
}

qint64 RateLimiter::reserve(Category category)
{
    const qint64 now = m_clock->nowMs();

    qint64 slot = now;
    if (m_hasGeneral)
    {
        slot = qMax(slot, m_lastGeneral + m_generalIntervalMs);
    }
    if (category == File && m_hasFile)
    {
        slot = qMax(slot, m_lastFile + m_fileIntervalMs);
    }

    if (m_bulkIntervalMs > 0 && m_bulkPauseMs > 0)
    {
        if (!m_hasGeneral || slot - m_lastGeneral >= m_bulkPauseMs)
        {
            m_bulkStart = slot;
        }
        else if (slot - m_bulkStart >= m_bulkIntervalMs)
        {
            LOG(QString("[AniDB Rate Limiter] %1 min of continuous traffic, pausing %2 min")
                .arg(m_bulkIntervalMs / 60000.0).arg(m_bulkPauseMs / 60000.0));
            slot += m_bulkPauseMs;
            m_bulkStart = slot;
        }
    }

    m_lastGeneral = slot;
    m_hasGeneral = true;
    if (category == File)
    {
        m_lastFile = slot;
        m_hasFile = true;
    }

    return slot - now;
}

void RateLimiter::reset()
{
    m_hasGeneral = false;
    m_hasFile = false;
    m_lastGeneral = 0;
    m_lastFile = 0;
    m_bulkStart = 0;
}
