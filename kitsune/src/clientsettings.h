#ifndef CLIENTSETTINGS_H
#define CLIENTSETTINGS_H

#include <QString>
#include <QSqlDatabase>
#include <cstdint>

/**
 * @brief Configuration of the AniDB client
 *
 * Values live in memory with the defaults below; load() and save() persist
 * them as name/value rows of the `settings` table in the given SQLite
 * database. A default-constructed object (no database) is a valid,
 * in-memory configuration.
 */
class ClientSettings
{
public:
    /**
     * @brief AniDB account credentials
     */
    struct AuthSettings {
        QString username;
        QString password;

        AuthSettings() = default;
    };

    /**
     * @brief Identity sent with every AUTH
     */
    struct ClientIdentity {
        QString name;
        int version;
        int protocolVersion;
        QString encoding;
        bool compression;   // adds comp=1 to AUTH

        ClientIdentity() : name("kitsune"), version(1), protocolVersion(3), encoding("UTF8"), compression(false) {}
    };

    /**
     * @brief Remote endpoint and local binding
     */
    struct EndpointSettings {
        QString host;
        quint16 port;
        quint16 localPort;  // 0 = any free port

        EndpointSettings() : host("api.anidb.net"), port(9000), localPort(3962) {}
    };

    /**
     * @brief Timeouts, windows and pacing, all in milliseconds
     */
    struct TimingSettings {
        int commandTimeoutMs;
        qint64 sessionLifetimeMs;
        qint64 banCooldownMs;       // the server never states the real value
        int generalIntervalMs;
        int fileIntervalMs;
        qint64 bulkIntervalMs;      // continuous traffic before a pause, 0 = never pause
        qint64 bulkPauseMs;

        TimingSettings()
            : commandTimeoutMs(30000)
            , sessionLifetimeMs(30 * 60 * 1000)
            , banCooldownMs(30 * 60 * 1000)
            , generalIntervalMs(2000)
            , fileIntervalMs(4000)
            , bulkIntervalMs(30 * 60 * 1000)
            , bulkPauseMs(5 * 60 * 1000) {}
    };

    /**
     * @brief FILE field-selection masks
     */
    struct LookupSettings {
        uint32_t fmask;
        uint32_t amask;

        LookupSettings();
    };

    explicit ClientSettings(QSqlDatabase database = QSqlDatabase());

    /**
     * @brief Create the `settings` table if missing
     * @return false if the database is unavailable or the statement failed
     */
    bool ensureTable();

    /**
     * @brief Load all settings from the database; unknown names are ignored,
     *        malformed numbers keep the current value
     */
    void load();

    /**
     * @brief Save all settings to the database
     * @return false if any row could not be written
     */
    bool save();

    QSqlDatabase database() const { return m_database; }

    const AuthSettings& auth() const { return m_auth; }
    AuthSettings& auth() { return m_auth; }

    const ClientIdentity& identity() const { return m_identity; }
    ClientIdentity& identity() { return m_identity; }

    const EndpointSettings& endpoint() const { return m_endpoint; }
    EndpointSettings& endpoint() { return m_endpoint; }

    const TimingSettings& timing() const { return m_timing; }
    TimingSettings& timing() { return m_timing; }

    const LookupSettings& lookup() const { return m_lookup; }
    LookupSettings& lookup() { return m_lookup; }

    bool hasCredentials() const { return !m_auth.username.isEmpty() && !m_auth.password.isEmpty(); }

private:
    bool saveSetting(const QString& name, const QString& value);

    QSqlDatabase m_database;

    AuthSettings m_auth;
    ClientIdentity m_identity;
    EndpointSettings m_endpoint;
    TimingSettings m_timing;
    LookupSettings m_lookup;
};

#endif // CLIENTSETTINGS_H
