#include "anidbclient.h"
#include "anidbcommandchannel.h"
#include "filelookupservice.h"
#include "udptransport.h"
#include "../clock.h"
#include "../futureutils.h"
#include "../logger.h"
#include "../hash/multihashcalculator.h"

AniDBClient::AniDBClient(const ClientSettings &settings, DatagramTransport *transport,
                         const Clock *clock, QObject *parent)
    : QObject(parent)
    , m_settings(settings)
    , m_clock(clock)
    , m_transport(transport)
{
    if (m_clock == nullptr)
    {
        m_ownedClock = std::make_unique<SystemClock>();
        m_clock = m_ownedClock.get();
    }

    if (m_transport == nullptr)
    {
        const ClientSettings::EndpointSettings &endpoint = m_settings.endpoint();
        m_transport = new UdpTransport(endpoint.host, endpoint.port, endpoint.localPort, this);
    }

    const ClientSettings::TimingSettings &timing = m_settings.timing();
    m_channel = new AniDBCommandChannel(m_transport, m_clock,
                                        timing.generalIntervalMs, timing.fileIntervalMs,
                                        timing.banCooldownMs, timing.commandTimeoutMs, this);
    m_channel->rateLimiter().setBulkPause(timing.bulkIntervalMs, timing.bulkPauseMs);
    m_session = new SessionManager(m_channel, &m_settings, m_clock, this);
    m_lookup = new FileLookupService(m_session, m_channel, &m_settings, this);
}

AniDBClient::~AniDBClient()
{
    // ~QObject deletes children in creation order, which would drop an owned transport before the channel
    delete m_lookup;
    delete m_session;
    delete m_channel;
}

bool AniDBClient::open()
{
    return m_channel->open();
}

QFuture<void> AniDBClient::close()
{
    return m_session->logout();
}

QFuture<QString> AniDBClient::login()
{
    return m_session->ensureSession();
}

QFuture<void> AniDBClient::logout()
{
    return m_session->logout();
}

QFuture<std::optional<AniDBFileRecord>> AniDBClient::lookupFile(const QString &ed2kHash, qint64 sizeBytes)
{
    return m_lookup->lookupFile(ed2kHash, sizeBytes);
}

QFuture<FileIdentification> AniDBClient::identifyFile(const QString &path)
{
    auto promise = std::make_shared<QPromise<FileIdentification>>();
    promise->start();
    QFuture<FileIdentification> future = promise->future();

    FutureUtils::observe(this, MultiHashCalculator::computeContentDigest(path),
        [this, path, promise](const ContentDigest &digest)
        {
            FutureUtils::observe(this, m_lookup->lookupFile(digest.ed2k(), digest.sizeBytes()),
                [path, digest, promise](const std::optional<AniDBFileRecord> &record)
                {
                    FileIdentification result;
                    result.path = path;
                    result.digest = digest;
                    result.record = record;
                    promise->addResult(result);
                    promise->finish();
                },
                [promise](std::exception_ptr error)
                {
                    promise->setException(error);
                    promise->finish();
                });
        },
        [path, promise](std::exception_ptr error)
        {
            LOG(QString("[Hasher] Hashing %1 failed: %2").arg(path, FutureUtils::errorMessage(error)));
            promise->setException(error);
            promise->finish();
        });

    return future;
}

bool AniDBClient::isBanned()
{
    return m_channel->banGuard().isBanned();
}

SessionManager::State AniDBClient::sessionState() const
{
    return m_session->state();
}
