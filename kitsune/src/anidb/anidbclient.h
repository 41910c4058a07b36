#ifndef ANIDBCLIENT_H
#define ANIDBCLIENT_H

#include <QObject>
#include <QFuture>
#include <QString>
#include <memory>
#include <optional>
#include "anidbfilerecord.h"
#include "sessionmanager.h"
#include "../clientsettings.h"
#include "../hash/contentdigest.h"

class AniDBCommandChannel;
class Clock;
class DatagramTransport;
class FileLookupService;

/**
 * @brief Outcome of AniDBClient::identifyFile()
 */
struct FileIdentification
{
    QString path;
    ContentDigest digest;
    std::optional<AniDBFileRecord> record;   // nullopt: AniDB does not know the file

    bool isKnown() const { return record.has_value(); }
};

Q_DECLARE_METATYPE(FileIdentification)

/**
 * @brief One AniDB UDP client: one socket, at most one session
 *
 * Owns the command channel, the session manager and the lookup service and
 * wires them to the given transport and clock. Everything runs on the event
 * loop of the thread that created the client; only hashing goes to the
 * thread pool.
 *
 * Usage:
 *   AniDBClient client(settings);
 *   client.open();
 *   QFuture<FileIdentification> f = client.identifyFile("/videos/ep01.mkv");
 *   ...
 *   client.close();   // LOGOUT, then release the socket
 */
class AniDBClient : public QObject
{
    Q_OBJECT
public:
    /**
     * @param transport nullptr creates a UdpTransport for the configured
     *        endpoint; a supplied transport must outlive the client
     * @param clock nullptr uses the wall clock; a supplied clock must outlive the client
     */
    explicit AniDBClient(const ClientSettings &settings, DatagramTransport *transport = nullptr,
                         const Clock *clock = nullptr, QObject *parent = nullptr);
    ~AniDBClient() override;

    /**
     * @brief Open the socket
     * @return false if the transport could not be opened (see the log)
     */
    bool open();

    // Best-effort LOGOUT, then socket release
    QFuture<void> close();

    QFuture<QString> login();
    QFuture<void> logout();

    QFuture<std::optional<AniDBFileRecord>> lookupFile(const QString &ed2kHash, qint64 sizeBytes);

    /**
     * @brief Hash the file (ED2K, SHA-1, MD5, CRC-32) and look it up
     *
     * Hash failures arrive as HashError, lookup failures as AniDBError.
     */
    QFuture<FileIdentification> identifyFile(const QString &path);

    bool isBanned();
    SessionManager::State sessionState() const;

    const ClientSettings &settings() const { return m_settings; }
    AniDBCommandChannel *channel() const { return m_channel; }
    SessionManager *sessionManager() const { return m_session; }

private:
    ClientSettings m_settings;
    std::unique_ptr<Clock> m_ownedClock;
    const Clock *m_clock;
    DatagramTransport *m_transport;
    AniDBCommandChannel *m_channel;
    SessionManager *m_session;
    FileLookupService *m_lookup;
};

#endif // ANIDBCLIENT_H
