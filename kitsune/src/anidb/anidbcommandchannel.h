#ifndef ANIDBCOMMANDCHANNEL_H
#define ANIDBCOMMANDCHANNEL_H

#include <QObject>
#include <QFuture>
#include <QPromise>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>
#include <memory>
#include "anidbreply.h"
#include "banguard.h"
#include "ratelimiter.h"

class Clock;
class DatagramTransport;
class QTimer;

/**
 * @brief One command waiting for its reply
 *
 * Lives in the channel's tag table from the moment it is sent until either
 * its reply or its timeout removes it, whichever comes first.
 */
struct PendingCommand
{
    QString tag;
    QString command;
    int timeoutMs = 0;
    std::shared_ptr<QPromise<AniDBReply>> promise;
    QTimer *timeout = nullptr;
};

/**
 * @brief Request/response layer over a DatagramTransport
 *
 * sendCommand() reserves a RateLimiter slot, waits for it on the event loop,
 * tags the command, sends it and returns a future that resolves with the
 * correlated AniDBReply. Several commands may be in flight at once; each
 * one's reply is matched by tag alone, so reordered replies are fine.
 *
 * Failures delivered through the future:
 * - AniDBBannedError: the BanGuard is active (nothing is sent), or the reply
 *   was 555 / 504
 * - AniDBTransportError: the transport could not be opened, refused the
 *   datagram or reported transportError(), or the channel was closed while
 *   the command was pending
 * - AniDBTimeoutError: no reply within the command's timeout
 * - AniDBProtocolError: the reply carried the tag but no reply code
 *
 * Every other reply code is handed back to the caller to interpret.
 * Replies with an unknown tag (late, duplicate, unsolicited) are discarded.
 *
 * Must be used from the thread that owns it.
 */
class AniDBCommandChannel : public QObject
{
    Q_OBJECT
public:
    using Params = QList<QPair<QString, QString>>;

    // Used when the constructor is given a timeout <= 0
    static constexpr int DEFAULT_COMMAND_TIMEOUT_MS = 30000;

    AniDBCommandChannel(DatagramTransport *transport, const Clock *clock,
                        int generalIntervalMs, int fileIntervalMs,
                        qint64 banCooldownMs, int commandTimeoutMs,
                        QObject *parent = nullptr);
    ~AniDBCommandChannel() override;

    /**
     * @param timeoutMs reply timeout; <= 0 uses the channel default
     */
    QFuture<AniDBReply> sendCommand(const QString &command, const Params &params,
                                    RateLimiter::Category category = RateLimiter::General,
                                    int timeoutMs = 0);

    // Open the transport if it is not open yet
    bool open();

    /**
     * @brief Fail every pending and queued command with AniDBTransportError
     *        and close the transport
     */
    void close();

    bool isOpen() const;

    /**
     * @brief Wire form of a command: `COMMAND k1=v1&k2=v2&tag=N`, values percent-encoded
     */
    static QByteArray buildCommand(const QString &command, const Params &params, const QString &tag);

    BanGuard &banGuard() { return m_banGuard; }
    RateLimiter &rateLimiter() { return m_rateLimiter; }

    int pendingCount() const { return m_pending.size(); }
    int commandTimeoutMs() const { return m_commandTimeoutMs; }

private slots:
    void onDatagramReceived(const QByteArray &datagram);
    void onTransportError(const QString &message);

private:
    void dispatch(const QString &command, const Params &params, int timeoutMs,
                  quint64 generation, const std::shared_ptr<QPromise<AniDBReply>> &promise);
    void onTimeout(const QString &tag);
    void failAll(const QString &reason);
    QString nextTag();

    static void fail(const std::shared_ptr<QPromise<AniDBReply>> &promise, const QException &error);
    static QString loggableCommand(const QString &command, const Params &params, const QString &tag);

    DatagramTransport *m_transport;
    RateLimiter m_rateLimiter;
    BanGuard m_banGuard;
    int m_commandTimeoutMs;

    QHash<QString, PendingCommand> m_pending;
    quint32 m_nextTag;

    // Bumped by close(); commands still waiting for their rate slot compare it
    quint64 m_generation;
    QList<std::shared_ptr<QPromise<AniDBReply>>> m_queued;
};

#endif // ANIDBCOMMANDCHANNEL_H
