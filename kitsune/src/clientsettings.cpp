#include "clientsettings.h"
#include "anidb/filemask.h"
#include "logger.h"
#include <QSqlQuery>
#include <QSqlError>
#include <QVariant>

ClientSettings::LookupSettings::LookupSettings()
    : fmask(FileMask::DEFAULT_FMASK)
    , amask(FileMask::DEFAULT_AMASK)
{
}

ClientSettings::ClientSettings(QSqlDatabase database)
    : m_database(database)
{
}

bool ClientSettings::ensureTable()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        LOG("[Settings] Database not available, cannot create settings table");
        return false;
    }

    QSqlQuery query(m_database);
    if (!query.exec("CREATE TABLE IF NOT EXISTS `settings`(`id` INTEGER PRIMARY KEY, `name` TEXT UNIQUE, `value` TEXT);")) {
        LOG("[Settings] Failed to create settings table: " + query.lastError().text());
        return false;
    }
    return true;
}

static void readInt(const QString& name, const QString& value, int& target, int minimum = 0)
{
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (ok && parsed >= minimum) {
        target = parsed;
    } else {
        LOG(QString("[Settings] Ignoring malformed value for %1: %2").arg(name, value));
    }
}

static void readInt64(const QString& name, const QString& value, qint64& target)
{
    bool ok = false;
    const qint64 parsed = value.toLongLong(&ok);
    if (ok && parsed >= 0) {
        target = parsed;
    } else {
        LOG(QString("[Settings] Ignoring malformed value for %1: %2").arg(name, value));
    }
}

static void readPort(const QString& name, const QString& value, quint16& target)
{
    bool ok = false;
    const uint parsed = value.toUInt(&ok);
    if (ok && parsed <= 65535) {
        target = static_cast<quint16>(parsed);
    } else {
        LOG(QString("[Settings] Ignoring malformed port for %1: %2").arg(name, value));
    }
}

static void readMask(const QString& name, const QString& value, uint32_t& target)
{
    if (!FileMask::fromHex(value, target)) {
        LOG(QString("[Settings] Ignoring malformed mask for %1: %2").arg(name, value));
    }
}

void ClientSettings::load()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        LOG("[Settings] Database not available, using defaults");
        return;
    }

    QSqlQuery query(m_database);
    if (!query.exec("SELECT `name`, `value` FROM `settings`")) {
        LOG("[Settings] Failed to read settings: " + query.lastError().text());
        return;
    }

    while (query.next()) {
        const QString name = query.value(0).toString();
        const QString value = query.value(1).toString();

        // Authentication
        if (name == "username") {
            m_auth.username = value;
        }
        else if (name == "password") {
            m_auth.password = value;
        }
        // Client identity
        else if (name == "clientName") {
            if (!value.isEmpty()) {
                m_identity.name = value;
            }
        }
        else if (name == "clientVersion") {
            readInt(name, value, m_identity.version);
        }
        else if (name == "protocolVersion") {
            readInt(name, value, m_identity.protocolVersion);
        }
        else if (name == "encoding") {
            if (!value.isEmpty()) {
                m_identity.encoding = value;
            }
        }
        else if (name == "compression") {
            m_identity.compression = (value == "1");
        }
        // Endpoint
        else if (name == "anidbHost") {
            if (!value.isEmpty()) {
                m_endpoint.host = value;
            }
        }
        else if (name == "anidbPort") {
            readPort(name, value, m_endpoint.port);
        }
        else if (name == "localPort") {
            readPort(name, value, m_endpoint.localPort);
        }
        // Timing
        else if (name == "commandTimeoutMs") {
            readInt(name, value, m_timing.commandTimeoutMs, 1);
        }
        else if (name == "sessionLifetimeMs") {
            readInt64(name, value, m_timing.sessionLifetimeMs);
        }
        else if (name == "banCooldownMs") {
            readInt64(name, value, m_timing.banCooldownMs);
        }
        else if (name == "generalIntervalMs") {
            readInt(name, value, m_timing.generalIntervalMs);
        }
        else if (name == "fileIntervalMs") {
            readInt(name, value, m_timing.fileIntervalMs);
        }
        else if (name == "bulkIntervalMs") {
            readInt64(name, value, m_timing.bulkIntervalMs);
        }
        else if (name == "bulkPauseMs") {
            readInt64(name, value, m_timing.bulkPauseMs);
        }
        // Lookup masks
        else if (name == "fileFmask") {
            readMask(name, value, m_lookup.fmask);
        }
        else if (name == "fileAmask") {
            readMask(name, value, m_lookup.amask);
        }
    }
}

bool ClientSettings::save()
{
    if (!m_database.isValid() || !m_database.isOpen()) {
        LOG("[Settings] Database not available, cannot save settings");
        return false;
    }

    LOG("[Settings] Saving client settings to database");

    bool ok = true;
    ok &= saveSetting("username", m_auth.username);
    ok &= saveSetting("password", m_auth.password);

    ok &= saveSetting("clientName", m_identity.name);
    ok &= saveSetting("clientVersion", QString::number(m_identity.version));
    ok &= saveSetting("protocolVersion", QString::number(m_identity.protocolVersion));
    ok &= saveSetting("encoding", m_identity.encoding);
    ok &= saveSetting("compression", m_identity.compression ? "1" : "0");

    ok &= saveSetting("anidbHost", m_endpoint.host);
    ok &= saveSetting("anidbPort", QString::number(m_endpoint.port));
    ok &= saveSetting("localPort", QString::number(m_endpoint.localPort));

    ok &= saveSetting("commandTimeoutMs", QString::number(m_timing.commandTimeoutMs));
    ok &= saveSetting("sessionLifetimeMs", QString::number(m_timing.sessionLifetimeMs));
    ok &= saveSetting("banCooldownMs", QString::number(m_timing.banCooldownMs));
    ok &= saveSetting("generalIntervalMs", QString::number(m_timing.generalIntervalMs));
    ok &= saveSetting("fileIntervalMs", QString::number(m_timing.fileIntervalMs));
    ok &= saveSetting("bulkIntervalMs", QString::number(m_timing.bulkIntervalMs));
    ok &= saveSetting("bulkPauseMs", QString::number(m_timing.bulkPauseMs));

    ok &= saveSetting("fileFmask", FileMask::toHex(m_lookup.fmask));
    ok &= saveSetting("fileAmask", FileMask::toHex(m_lookup.amask));

    return ok;
}

bool ClientSettings::saveSetting(const QString& name, const QString& value)
{
    QSqlQuery query(m_database);
    query.prepare("INSERT OR REPLACE INTO `settings`(`name`, `value`) VALUES (?, ?)");
    query.addBindValue(name);
    query.addBindValue(value);

    if (!query.exec()) {
        LOG(QString("[Settings] Failed to save setting %1: %2")
            .arg(name, query.lastError().text()));
        return false;
    }
    return true;
}
