#ifndef SESSIONMANAGER_H
#define SESSIONMANAGER_H

#include <QObject>
#include <QFuture>
#include <QPromise>
#include <QString>
#include <memory>
#include "anidbreply.h"
#include "sessioninfo.h"

class AniDBCommandChannel;
class ClientSettings;
class Clock;

/**
 * @brief AUTH / LOGOUT state machine and owner of the session key
 *
 * LoggedOut -> Authenticating -> LoggedIn -> LoggedOut
 *
 * - 200/201: logged in, the first token of the reply is the session key,
 *   valid for the configured session lifetime
 * - 500/502/503/505: AniDBAuthError, state stays LoggedOut, never retried
 * - invalidate(key) is called by command users that got 403/501/506 back
 *   for a command sent with that key; a rejection of an older key is ignored
 * - logout() sends LOGOUT best effort, then clears the session and closes
 *   the channel no matter what the server said
 */
class SessionManager : public QObject
{
    Q_OBJECT
public:
    enum State
    {
        LoggedOut,
        Authenticating,
        LoggedIn
    };
    Q_ENUM(State)

    SessionManager(AniDBCommandChannel *channel, const ClientSettings *settings,
                   const Clock *clock, QObject *parent = nullptr);

    /**
     * @brief Session key for the next command
     *
     * Resolves immediately with the cached key (no network traffic) while
     * logged in and unexpired, joins a login already in progress, and logs
     * in otherwise.
     */
    QFuture<QString> ensureSession();

    // Log in even if a session exists; joins a login already in progress
    QFuture<QString> login();

    /**
     * @brief Forget the session after the server rejected @p rejectedKey
     *
     * Does nothing while a login is in progress or when the current key is
     * not the rejected one (a late reply to a command sent before a relogin).
     */
    void invalidate(const QString &rejectedKey);

    QFuture<void> logout();

    State state() const { return m_state; }
    SessionInfo session() const { return m_session; }

    static QString stateName(State state);

signals:
    void stateChanged(SessionManager::State state);

private:
    void handleAuthReply(const AniDBReply &reply, const std::shared_ptr<QPromise<QString>> &promise);
    void finishLogin(const std::shared_ptr<QPromise<QString>> &promise, const QException &error);
    void setState(State state);

    AniDBCommandChannel *m_channel;
    const ClientSettings *m_settings;
    const Clock *m_clock;

    State m_state;
    SessionInfo m_session;
    std::shared_ptr<QPromise<QString>> m_loginPromise;
};

#endif // SESSIONMANAGER_H
