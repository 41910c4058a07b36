#ifndef SESSIONINFO_H
#define SESSIONINFO_H

#include <QString>

/**
 * @brief The AniDB session key and its validity window
 *
 * Owned by SessionManager; empty (not logged in) after construction, logout
 * or an invalid-session reply.
 */
class SessionInfo
{
public:
    SessionInfo();
    SessionInfo(const QString &sessionKey, qint64 createdAtMs, qint64 expiresAtMs);

    QString sessionKey() const { return m_sessionKey; }
    qint64 createdAtMs() const { return m_createdAtMs; }
    qint64 expiresAtMs() const { return m_expiresAtMs; }
    bool isLoggedIn() const { return m_loggedIn; }

    // Logged in and not yet expired at nowMs
    bool isValid(qint64 nowMs) const;

    void clear();

private:
    QString m_sessionKey;
    qint64 m_createdAtMs;
    qint64 m_expiresAtMs;
    bool m_loggedIn;
};

#endif // SESSIONINFO_H
