#include "anidbcommandchannel.h"
#include "anidbresponsedecoder.h"
#include "datagramtransport.h"
#include "../errors.h"
#include "../futureutils.h"
#include "../logger.h"
#include <QTimer>
#include <QUrl>

AniDBCommandChannel::AniDBCommandChannel(DatagramTransport *transport, const Clock *clock,
                                         int generalIntervalMs, int fileIntervalMs,
                                         qint64 banCooldownMs, int commandTimeoutMs,
                                         QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_rateLimiter(clock, generalIntervalMs, fileIntervalMs)
    , m_banGuard(clock, banCooldownMs)
    , m_commandTimeoutMs(commandTimeoutMs > 0 ? commandTimeoutMs : DEFAULT_COMMAND_TIMEOUT_MS)
    , m_nextTag(1)
    , m_generation(0)
{
    connect(m_transport, &DatagramTransport::datagramReceived,
            this, &AniDBCommandChannel::onDatagramReceived);
    connect(m_transport, &DatagramTransport::transportError,
            this, &AniDBCommandChannel::onTransportError);
}

AniDBCommandChannel::~AniDBCommandChannel()
{
    failAll("Channel destroyed");
}

bool AniDBCommandChannel::open()
{
    if (m_transport->isOpen())
    {
        return true;
    }
    if (!m_transport->open())
    {
        LOG("[AniDB Channel] Failed to open transport: " + m_transport->errorString());
        return false;
    }
    return true;
}

bool AniDBCommandChannel::isOpen() const
{
    return m_transport->isOpen();
}

void AniDBCommandChannel::close()
{
    failAll("Channel closed");

    if (m_transport->isOpen())
    {
        m_transport->close();
    }
}

void AniDBCommandChannel::onTransportError(const QString &message)
{
    LOG("[AniDB Channel] Transport error: " + message);
    failAll("Transport error: " + message);
    if (m_transport->isOpen())
    {
        m_transport->close();
    }
}

void AniDBCommandChannel::failAll(const QString &reason)
{
    ++m_generation;

    const QList<std::shared_ptr<QPromise<AniDBReply>>> queued = m_queued;
    m_queued.clear();
    for (const auto &promise : queued)
    {
        fail(promise, AniDBTransportError(reason + " before the command was sent"));
    }

    const QHash<QString, PendingCommand> pending = m_pending;
    m_pending.clear();
    for (const PendingCommand &entry : pending)
    {
        entry.timeout->stop();
        entry.timeout->deleteLater();
        fail(entry.promise, AniDBTransportError(
            QString("%1 while %2 (tag %3) was waiting for a reply").arg(reason, entry.command, entry.tag)));
    }

    if (!queued.isEmpty() || !pending.isEmpty())
    {
        LOG(QString("[AniDB Channel] %1 with %2 queued and %3 pending commands")
            .arg(reason).arg(queued.size()).arg(pending.size()));
    }
}

QFuture<AniDBReply> AniDBCommandChannel::sendCommand(const QString &command, const Params &params,
                                                     RateLimiter::Category category, int timeoutMs)
{
    if (m_banGuard.isBanned())
    {
        LOG(QString("[AniDB Channel] %1 refused, client is banned").arg(command));
        return FutureUtils::makeFailed<AniDBReply>(
            AniDBBannedError(m_banGuard.reason(), m_banGuard.expiresAtMs()));
    }

    if (!open())
    {
        return FutureUtils::makeFailed<AniDBReply>(
            AniDBTransportError("Cannot open transport: " + m_transport->errorString()));
    }

    const int effectiveTimeout = timeoutMs > 0 ? timeoutMs : m_commandTimeoutMs;
    auto promise = std::make_shared<QPromise<AniDBReply>>();
    promise->start();
    QFuture<AniDBReply> future = promise->future();

    const qint64 delay = m_rateLimiter.reserve(category);
    if (delay <= 0)
    {
        dispatch(command, params, effectiveTimeout, m_generation, promise);
        return future;
    }

    LOG(QString("[AniDB Channel] %1 delayed %2 ms by rate limit").arg(command).arg(delay));
    m_queued.append(promise);
    const quint64 generation = m_generation;
    // PreciseTimer: a coarse timer may fire up to 5% early and break the spacing
    QTimer::singleShot(static_cast<int>(delay), Qt::PreciseTimer, this,
        [this, command, params, effectiveTimeout, generation, promise]()
        {
            m_queued.removeOne(promise);
            dispatch(command, params, effectiveTimeout, generation, promise);
        });
    return future;
}

void AniDBCommandChannel::dispatch(const QString &command, const Params &params, int timeoutMs,
                                   quint64 generation, const std::shared_ptr<QPromise<AniDBReply>> &promise)
{
    // close() already failed it
    if (generation != m_generation)
    {
        return;
    }

    // A ban may have arrived while this command waited for its slot
    if (m_banGuard.isBanned())
    {
        LOG(QString("[AniDB Channel] %1 dropped before sending, client is banned").arg(command));
        fail(promise, AniDBBannedError(m_banGuard.reason(), m_banGuard.expiresAtMs()));
        return;
    }

    if (!open())
    {
        fail(promise, AniDBTransportError("Cannot open transport: " + m_transport->errorString()));
        return;
    }

    const QString tag = nextTag();

    PendingCommand entry;
    entry.tag = tag;
    entry.command = command;
    entry.timeoutMs = timeoutMs;
    entry.promise = promise;
    entry.timeout = new QTimer(this);
    entry.timeout->setSingleShot(true);
    connect(entry.timeout, &QTimer::timeout, this, [this, tag]() { onTimeout(tag); });

    // Registered before sending: a transport may deliver the reply from inside send()
    m_pending.insert(tag, entry);
    entry.timeout->start(timeoutMs);

    LOG("[AniDB Send] " + loggableCommand(command, params, tag));

    if (!m_transport->send(buildCommand(command, params, tag)))
    {
        const QString error = m_transport->errorString();
        LOG(QString("[AniDB Send] %1 (tag %2) failed: %3").arg(command, tag, error));
        if (m_pending.remove(tag) > 0)
        {
            entry.timeout->stop();
            entry.timeout->deleteLater();
            fail(promise, AniDBTransportError(QString("Sending %1 failed: %2").arg(command, error)));
        }
    }
}

void AniDBCommandChannel::onDatagramReceived(const QByteArray &datagram)
{
    const AniDBReply reply = AniDBResponseDecoder::decode(datagram);

    if (reply.rawText.isEmpty())
    {
        LOG(QString("[AniDB Recv] Dropping undecodable datagram (%1 bytes)").arg(datagram.size()));
        return;
    }

    LOG(QString("[AniDB Recv] Tag: %1 Code: %2 %3%4")
        .arg(reply.tag, reply.code, reply.message,
             reply.truncated ? QStringLiteral(" [TRUNCATED]") : QString()));

    const int code = reply.codeValue();
    const bool banned = code == 555 || code == 504;
    const QString banReason = reply.payloadLines.isEmpty() ? reply.message : reply.payloadLines.first();

    // A ban applies to the whole client whether or not the reply can be correlated
    if (banned)
    {
        m_banGuard.markBanned(banReason);
    }

    if (!reply.hasTag())
    {
        LOG("[AniDB Recv] Tagless reply cannot be correlated, dropped: " + reply.firstLine());
        return;
    }

    auto it = m_pending.find(reply.tag);
    if (it == m_pending.end())
    {
        LOG(QString("[AniDB Recv] No pending command for tag %1, dropped").arg(reply.tag));
        return;
    }

    const PendingCommand entry = it.value();
    m_pending.erase(it);
    entry.timeout->stop();
    entry.timeout->deleteLater();

    if (!reply.isWellFormed())
    {
        fail(entry.promise, AniDBProtocolError(QString(),
            QString("Malformed reply to %1").arg(entry.command), reply.firstLine()));
        return;
    }

    if (banned)
    {
        fail(entry.promise, AniDBBannedError(m_banGuard.reason(), m_banGuard.expiresAtMs()));
        return;
    }

    entry.promise->addResult(reply);
    entry.promise->finish();
}

void AniDBCommandChannel::onTimeout(const QString &tag)
{
    auto it = m_pending.find(tag);
    if (it == m_pending.end())
    {
        return;
    }

    const PendingCommand entry = it.value();
    m_pending.erase(it);
    entry.timeout->deleteLater();

    LOG(QString("[AniDB Timeout] %1 (tag %2) got no reply within %3 ms")
        .arg(entry.command, entry.tag).arg(entry.timeoutMs));
    fail(entry.promise, AniDBTimeoutError(entry.command, entry.tag, entry.timeoutMs));
}

QString AniDBCommandChannel::nextTag()
{
    QString tag;
    do
    {
        if (m_nextTag == 0)
        {
            m_nextTag = 1;
        }
        tag = QString::number(m_nextTag++);
    } while (m_pending.contains(tag));
    return tag;
}

QByteArray AniDBCommandChannel::buildCommand(const QString &command, const Params &params, const QString &tag)
{
    QByteArray line = command.toUtf8();
    bool first = true;
    for (const auto &param : params)
    {
        line += first ? ' ' : '&';
        line += param.first.toUtf8();
        line += '=';
        line += QUrl::toPercentEncoding(param.second);
        first = false;
    }
    line += first ? ' ' : '&';
    line += "tag=";
    line += tag.toUtf8();
    return line;
}

QString AniDBCommandChannel::loggableCommand(const QString &command, const Params &params, const QString &tag)
{
    Params shown;
    for (const auto &param : params)
    {
        if (param.first == QLatin1String("pass"))
        {
            shown.append(qMakePair(param.first, QStringLiteral("hidden")));
        }
        else if (param.first == QLatin1String("s"))
        {
            shown.append(qMakePair(param.first, Logger::redact(param.second)));
        }
        else
        {
            shown.append(param);
        }
    }
    return QString::fromUtf8(buildCommand(command, shown, tag));
}

void AniDBCommandChannel::fail(const std::shared_ptr<QPromise<AniDBReply>> &promise, const QException &error)
{
    promise->setException(error);
    promise->finish();
}
