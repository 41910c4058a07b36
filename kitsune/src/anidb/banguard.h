#ifndef BANGUARD_H
#define BANGUARD_H

#include <QString>

class Clock;

/**
 * @brief Remembers a ban reply and blocks sends until the cooldown passes
 *
 * AniDB never says how long a ban lasts, so the cooldown is an assumption
 * taken from the settings (30 minutes by default).
 */
class BanGuard
{
public:
    BanGuard(const Clock *clock, qint64 cooldownMs);

    void markBanned(const QString &reason);

    // Clears the ban once the clock has passed the expiry
    bool isBanned();

    qint64 expiresAtMs() const { return m_expiresAtMs; }
    QString reason() const { return m_reason; }
    qint64 cooldownMs() const { return m_cooldownMs; }

    void clear();

private:
    const Clock *m_clock;
    qint64 m_cooldownMs;
    bool m_banned;
    qint64 m_expiresAtMs;
    QString m_reason;
};

#endif // BANGUARD_H
