#include "sessionmanager.h"
#include "anidbcommandchannel.h"
#include "../clientsettings.h"
#include "../clock.h"
#include "../errors.h"
#include "../futureutils.h"
#include "../logger.h"

SessionManager::SessionManager(AniDBCommandChannel *channel, const ClientSettings *settings,
                               const Clock *clock, QObject *parent)
    : QObject(parent)
    , m_channel(channel)
    , m_settings(settings)
    , m_clock(clock)
    , m_state(LoggedOut)
{
}

QString SessionManager::stateName(State state)
{
    switch (state)
    {
    case LoggedOut: return QStringLiteral("LoggedOut");
    case Authenticating: return QStringLiteral("Authenticating");
    case LoggedIn: return QStringLiteral("LoggedIn");
    }
    return QString();
}

void SessionManager::setState(State state)
{
    if (m_state == state)
    {
        return;
    }
    m_state = state;
    emit stateChanged(state);
}

QFuture<QString> SessionManager::ensureSession()
{
    if (m_state == LoggedIn)
    {
        if (m_session.isValid(m_clock->nowMs()))
        {
            return FutureUtils::makeReady(m_session.sessionKey());
        }
        LOG("[AniDB Session] Session expired locally, logging in again");
        m_session.clear();
        setState(LoggedOut);
    }
    return login();
}

QFuture<QString> SessionManager::login()
{
    if (m_state == Authenticating && m_loginPromise)
    {
        return m_loginPromise->future();
    }

    if (!m_settings->hasCredentials())
    {
        LOG("[AniDB Auth] No username or password configured");
        return FutureUtils::makeFailed<QString>(AniDBAuthError(QString(), "No AniDB credentials configured"));
    }

    const ClientSettings::AuthSettings &auth = m_settings->auth();
    const ClientSettings::ClientIdentity &identity = m_settings->identity();

    AniDBCommandChannel::Params params;
    params << qMakePair(QStringLiteral("user"), auth.username)
           << qMakePair(QStringLiteral("pass"), auth.password)
           << qMakePair(QStringLiteral("protover"), QString::number(identity.protocolVersion))
           << qMakePair(QStringLiteral("client"), identity.name)
           << qMakePair(QStringLiteral("clientver"), QString::number(identity.version))
           << qMakePair(QStringLiteral("enc"), identity.encoding);
    if (identity.compression)
    {
        params << qMakePair(QStringLiteral("comp"), QStringLiteral("1"));
    }

    m_session.clear();
    m_loginPromise = std::make_shared<QPromise<QString>>();
    m_loginPromise->start();
    QFuture<QString> future = m_loginPromise->future();
    setState(Authenticating);

    LOG(QString("[AniDB Auth] Logging in as %1").arg(auth.username));

    const std::shared_ptr<QPromise<QString>> promise = m_loginPromise;
    FutureUtils::observe(this, m_channel->sendCommand("AUTH", params),
        [this, promise](const AniDBReply &reply)
        {
            handleAuthReply(reply, promise);
        },
        [this, promise](std::exception_ptr error)
        {
            LOG("[AniDB Auth] Login failed: " + FutureUtils::errorMessage(error));
            if (m_loginPromise == promise)
            {
                m_loginPromise.reset();
                setState(LoggedOut);
            }
            promise->setException(error);
            promise->finish();
        });

    return future;
}

void SessionManager::handleAuthReply(const AniDBReply &reply, const std::shared_ptr<QPromise<QString>> &promise)
{
    // Superseded by logout() or a newer login
    if (m_loginPromise != promise)
    {
        LOG(QString("[AniDB Auth] Ignoring stale AUTH reply %1").arg(reply.code));
        promise->setException(AniDBTransportError("Login abandoned"));
        promise->finish();
        return;
    }

    const int code = reply.codeValue();

    if (code == 200 || code == 201)
    {
        const QString key = reply.message.section(QLatin1Char(' '), 0, 0);
        if (key.isEmpty())
        {
            finishLogin(promise, AniDBProtocolError(reply.code, "Login accepted without a session key", reply.firstLine()));
            return;
        }
        if (code == 201)
        {
            LOG("[AniDB Auth] Server reports a newer client version");
        }

        const qint64 now = m_clock->nowMs();
        m_session = SessionInfo(key, now, now + m_settings->timing().sessionLifetimeMs);

        m_loginPromise.reset();
        setState(LoggedIn);
        LOG(QString("[AniDB Auth] Logged in, session %1").arg(Logger::redact(key)));
        promise->addResult(key);
        promise->finish();
        return;
    }

    switch (code)
    {
    case 500:
        finishLogin(promise, AniDBAuthError(reply.code, "Login failed: " + reply.message));
        break;
    case 502:
    case 505:
        finishLogin(promise, AniDBAuthError(reply.code, "Access denied: " + reply.message));
        break;
    case 503:
        finishLogin(promise, AniDBAuthError(reply.code, "Client version outdated: " + reply.message));
        break;
    default:
        finishLogin(promise, AniDBProtocolError(reply.code, "Unexpected reply to AUTH: " + reply.message, reply.firstLine()));
        break;
    }
}

void SessionManager::finishLogin(const std::shared_ptr<QPromise<QString>> &promise, const QException &error)
{
    LOG(QString("[AniDB Auth] Login failed: %1").arg(QString::fromUtf8(error.what())));
    m_loginPromise.reset();
    m_session.clear();
    setState(LoggedOut);
    promise->setException(error);
    promise->finish();
}

void SessionManager::invalidate(const QString &rejectedKey)
{
    if (m_state == Authenticating)
    {
        return;
    }
    if (!m_session.isLoggedIn())
    {
        return;
    }
    if (m_session.sessionKey() != rejectedKey)
    {
        LOG(QString("[AniDB Session] Rejection of old session %1 ignored, current session %2 kept")
            .arg(Logger::redact(rejectedKey), Logger::redact(m_session.sessionKey())));
        return;
    }
    LOG(QString("[AniDB Session] Session %1 rejected by server, cleared").arg(Logger::redact(rejectedKey)));
    m_session.clear();
    setState(LoggedOut);
}

QFuture<void> SessionManager::logout()
{
    auto promise = std::make_shared<QPromise<void>>();
    promise->start();
    QFuture<void> future = promise->future();

    if (m_state != LoggedIn || !m_session.isLoggedIn())
    {
        // Drops a login in progress too; its AUTH fails when the channel closes
        m_loginPromise.reset();
        m_session.clear();
        setState(LoggedOut);
        m_channel->close();
        promise->finish();
        return future;
    }

    AniDBCommandChannel::Params params;
    params << qMakePair(QStringLiteral("s"), m_session.sessionKey());

    m_session.clear();
    setState(LoggedOut);

    FutureUtils::observe(this, m_channel->sendCommand("LOGOUT", params),
        [this, promise](const AniDBReply &reply)
        {
            if (reply.codeValue() == 203)
            {
                LOG("[AniDB Auth] Logged out");
            }
            else
            {
                LOG(QString("[AniDB Auth] LOGOUT answered %1 %2").arg(reply.code, reply.message));
            }
            m_channel->close();
            promise->finish();
        },
        [this, promise](std::exception_ptr error)
        {
            LOG("[AniDB Auth] LOGOUT failed, session cleared anyway: " + FutureUtils::errorMessage(error));
            m_channel->close();
            promise->finish();
        });

    return future;
}
