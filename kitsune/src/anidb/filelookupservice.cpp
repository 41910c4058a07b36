#include "filelookupservice.h"
#include "anidbcommandchannel.h"
#include "anidbresponsedecoder.h"
#include "filemask.h"
#include "sessionmanager.h"
#include "../clientsettings.h"
#include "../errors.h"
#include "../futureutils.h"
#include "../logger.h"

namespace
{

void failPromise(const std::shared_ptr<QPromise<FileLookupService::Result>> &promise, std::exception_ptr error)
{
    promise->setException(error);
    promise->finish();
}

} // namespace

FileLookupService::FileLookupService(SessionManager *session, AniDBCommandChannel *channel,
                                     const ClientSettings *settings, QObject *parent)
    : QObject(parent)
    , m_session(session)
    , m_channel(channel)
    , m_settings(settings)
{
}

bool FileLookupService::isValidEd2k(const QString &hash)
{
    if (hash.size() != 32)
    {
        return false;
    }
    for (const QChar c : hash)
    {
        const bool hex = (c >= QLatin1Char('0') && c <= QLatin1Char('9'))
                      || (c >= QLatin1Char('a') && c <= QLatin1Char('f'))
                      || (c >= QLatin1Char('A') && c <= QLatin1Char('F'));
        if (!hex)
        {
            return false;
        }
    }
    return true;
}

bool FileLookupService::isInvalidSessionCode(int code)
{
    return code == 403 || code == 501 || code == 506;
}

QFuture<FileLookupService::Result> FileLookupService::lookupFile(const QString &ed2kHash, qint64 sizeBytes)
{
    if (!isValidEd2k(ed2kHash))
    {
        return FutureUtils::makeFailed<Result>(
            AniDBProtocolError(QString(), QString("Invalid ED2K hash \"%1\"").arg(ed2kHash)));
    }
    if (sizeBytes < 0)
    {
        return FutureUtils::makeFailed<Result>(
            AniDBProtocolError(QString(), QString("Invalid file size %1").arg(sizeBytes)));
    }

    auto promise = std::make_shared<QPromise<Result>>();
    promise->start();
    QFuture<Result> future = promise->future();

    attempt(ed2kHash.toLower(), sizeBytes, false, promise);
    return future;
}

void FileLookupService::attempt(const QString &ed2k, qint64 sizeBytes, bool isRetry,
                                const std::shared_ptr<QPromise<Result>> &promise)
{
    FutureUtils::observe(this, m_session->ensureSession(),
        [this, ed2k, sizeBytes, isRetry, promise](const QString &sessionKey)
        {
            // Decode with the masks this request is sent with, even if the settings change meanwhile
            const uint32_t fmask = m_settings->lookup().fmask;
            const uint32_t amask = m_settings->lookup().amask;

            AniDBCommandChannel::Params params;
            params << qMakePair(QStringLiteral("s"), sessionKey)
                   << qMakePair(QStringLiteral("size"), QString::number(sizeBytes))
                   << qMakePair(QStringLiteral("ed2k"), ed2k)
                   << qMakePair(QStringLiteral("fmask"), FileMask::toHex(fmask))
                   << qMakePair(QStringLiteral("amask"), FileMask::toHex(amask));

            FutureUtils::observe(this, m_channel->sendCommand("FILE", params, RateLimiter::File),
                [this, sessionKey, ed2k, sizeBytes, fmask, amask, isRetry, promise](const AniDBReply &reply)
                {
                    handleReply(reply, sessionKey, ed2k, sizeBytes, fmask, amask, isRetry, promise);
                },
                [promise](std::exception_ptr error)
                {
                    failPromise(promise, error);
                });
        },
        [promise](std::exception_ptr error)
        {
            failPromise(promise, error);
        });
}

void FileLookupService::handleReply(const AniDBReply &reply, const QString &sessionKey,
                                    const QString &ed2k, qint64 sizeBytes,
                                    uint32_t fmask, uint32_t amask, bool isRetry,
                                    const std::shared_ptr<QPromise<Result>> &promise)
{
    const int code = reply.codeValue();

    if (code == 220)
    {
        const AniDBFileRecord record = AniDBFileRecord::fromPayload(
            FileMask::fieldNames(fmask, amask), AniDBResponseDecoder::filePayload(reply), reply.truncated);
        LOG(QString("[AniDB File] %1 (%2 bytes) is fid %3").arg(ed2k).arg(sizeBytes).arg(record.valueAt(0)));
        promise->addResult(Result(record));
        promise->finish();
        return;
    }

    if (code == 320)
    {
        LOG(QString("[AniDB File] %1 (%2 bytes) not known to AniDB").arg(ed2k).arg(sizeBytes));
        promise->addResult(Result());
        promise->finish();
        return;
    }

    if (isInvalidSessionCode(code))
    {
        m_session->invalidate(sessionKey);
        if (isRetry)
        {
            LOG(QString("[AniDB File] Session rejected again (%1), giving up").arg(reply.code));
            promise->setException(AniDBSessionExpiredError(reply.code,
                "Session rejected after a fresh login: " + reply.message));
            promise->finish();
            return;
        }
        LOG(QString("[AniDB File] Session rejected (%1), logging in again and retrying once").arg(reply.code));
        attempt(ed2k, sizeBytes, true, promise);
        return;
    }

    promise->setException(AniDBProtocolError(reply.code,
        QString("FILE lookup failed: %1 %2").arg(reply.code, reply.message), reply.firstLine()));
    promise->finish();
}
