#ifndef FILELOOKUPSERVICE_H
#define FILELOOKUPSERVICE_H

#include <QObject>
#include <QFuture>
#include <QPromise>
#include <QString>
#include <cstdint>
#include <memory>
#include <optional>
#include "anidbfilerecord.h"
#include "anidbreply.h"

class AniDBCommandChannel;
class ClientSettings;
class SessionManager;

/**
 * @brief FILE lookup by ED2K hash and size
 *
 * lookupFile() gets a session, sends FILE in the File rate category and
 * resolves with:
 * - the decoded record on 220
 * - std::nullopt on 320 NO SUCH FILE
 *
 * 403/501/506 clear the session; the lookup logs in again and is retried
 * once. A second rejection fails with AniDBSessionExpiredError. Any other
 * code fails with AniDBProtocolError carrying the code and reply line.
 * A timeout is not retried.
 */
class FileLookupService : public QObject
{
    Q_OBJECT
public:
    using Result = std::optional<AniDBFileRecord>;

    FileLookupService(SessionManager *session, AniDBCommandChannel *channel,
                      const ClientSettings *settings, QObject *parent = nullptr);

    /**
     * @param ed2kHash 32 hex characters (any case)
     * @param sizeBytes exact byte length of the file, >= 0
     */
    QFuture<Result> lookupFile(const QString &ed2kHash, qint64 sizeBytes);

    static bool isValidEd2k(const QString &hash);
    static bool isInvalidSessionCode(int code);

private:
    void attempt(const QString &ed2k, qint64 sizeBytes, bool isRetry,
                 const std::shared_ptr<QPromise<Result>> &promise);
    void handleReply(const AniDBReply &reply, const QString &sessionKey, const QString &ed2k, qint64 sizeBytes,
                     uint32_t fmask, uint32_t amask, bool isRetry,
                     const std::shared_ptr<QPromise<Result>> &promise);

    SessionManager *m_session;
    AniDBCommandChannel *m_channel;
    const ClientSettings *m_settings;
};

#endif // FILELOOKUPSERVICE_H
