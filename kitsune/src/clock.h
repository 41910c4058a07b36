#ifndef CLOCK_H
#define CLOCK_H

#include <QtGlobal>

/**
 * @brief Source of "now" in milliseconds for rate limiting, session expiry and bans
 *
 * Tests substitute a manual clock so cooldowns and expiry can be crossed
 * without sleeping.
 */
class Clock
{
public:
    virtual ~Clock() = default;
    virtual qint64 nowMs() const = 0;
};

// Wall clock (QDateTime::currentMSecsSinceEpoch)
class SystemClock : public Clock
{
public:
    qint64 nowMs() const override;
};

#endif // CLOCK_H
