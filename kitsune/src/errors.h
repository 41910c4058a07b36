#ifndef ERRORS_H
#define ERRORS_H

#include <QException>
#include <QString>
#include <QByteArray>

/**
 * @file errors.h
 * @brief Exception types reported by the hasher and the AniDB client
 *
 * Every type derives from QException so it can be stored in a QPromise and
 * rethrown from QFuture::result() / waitForFinished() in the caller's thread.
 * raise() and clone() are overridden in every subclass so the dynamic type
 * survives the trip through the future.
 */

/**
 * @brief Failure while hashing a file
 */
class HashError : public QException
{
public:
    enum Kind
    {
        FileNotFound,   // path is not a readable regular file
        ReadError,      // I/O failure in the middle of the file
        Cancelled       // stop() was requested
    };

    HashError(Kind kind, const QString& path, const QString& detail = QString());

    Kind kind() const { return m_kind; }
    QString path() const { return m_path; }
    QString message() const { return m_message; }

    const char* what() const noexcept override { return m_what.constData(); }
    void raise() const override { throw *this; }
    HashError* clone() const override { return new HashError(*this); }

private:
    Kind m_kind;
    QString m_path;
    QString m_message;
    QByteArray m_what;
};

/**
 * @brief An operation whose future was cancelled before producing a value
 */
class CancelledError : public QException
{
public:
    const char* what() const noexcept override { return "operation cancelled"; }
    void raise() const override { throw *this; }
    CancelledError* clone() const override { return new CancelledError(*this); }
};

/**
 * @brief Base class of every AniDB protocol failure
 *
 * kind() lets callers switch on the failure without a dynamic_cast chain.
 * code() is the 3-digit reply code when the failure came from a reply,
 * empty otherwise.
 */
class AniDBError : public QException
{
public:
    enum Kind
    {
        Transport,
        Timeout,
        Auth,
        SessionExpired,
        Banned,
        Protocol
    };

    AniDBError(Kind kind, const QString& message, const QString& code = QString());

    Kind kind() const { return m_kind; }
    QString code() const { return m_code; }
    QString message() const { return m_message; }

    const char* what() const noexcept override { return m_what.constData(); }
    void raise() const override { throw *this; }
    AniDBError* clone() const override { return new AniDBError(*this); }

    static QString kindName(Kind kind);

private:
    Kind m_kind;
    QString m_code;
    QString m_message;
    QByteArray m_what;
};

// Socket could not be opened or the OS refused the datagram
class AniDBTransportError : public AniDBError
{
public:
    explicit AniDBTransportError(const QString& message)
        : AniDBError(Transport, message) {}
    void raise() const override { throw *this; }
    AniDBTransportError* clone() const override { return new AniDBTransportError(*this); }
};

// No correlated reply inside the command timeout
class AniDBTimeoutError : public AniDBError
{
public:
    AniDBTimeoutError(const QString& command, const QString& tag, int timeoutMs);
    QString command() const { return m_command; }
    QString tag() const { return m_tag; }
    void raise() const override { throw *this; }
    AniDBTimeoutError* clone() const override { return new AniDBTimeoutError(*this); }

private:
    QString m_command;
    QString m_tag;
};

// Bad credentials, access denied or client rejected. Never retried.
class AniDBAuthError : public AniDBError
{
public:
    AniDBAuthError(const QString& code, const QString& message)
        : AniDBError(Auth, message, code) {}
    void raise() const override { throw *this; }
    AniDBAuthError* clone() const override { return new AniDBAuthError(*this); }
};

// The server kept rejecting the session after one fresh login
class AniDBSessionExpiredError : public AniDBError
{
public:
    AniDBSessionExpiredError(const QString& code, const QString& message)
        : AniDBError(SessionExpired, message, code) {}
    void raise() const override { throw *this; }
    AniDBSessionExpiredError* clone() const override { return new AniDBSessionExpiredError(*this); }
};

/**
 * @brief The client is banned; sends fail fast until expiresAtMs
 */
class AniDBBannedError : public AniDBError
{
public:
    AniDBBannedError(const QString& reason, qint64 expiresAtMs);
    QString reason() const { return m_reason; }
    qint64 expiresAtMs() const { return m_expiresAtMs; }
    void raise() const override { throw *this; }
    AniDBBannedError* clone() const override { return new AniDBBannedError(*this); }

private:
    QString m_reason;
    qint64 m_expiresAtMs;
};

/**
 * @brief Unexpected or malformed reply; the raw reply line is kept for diagnostics
 */
class AniDBProtocolError : public AniDBError
{
public:
    AniDBProtocolError(const QString& code, const QString& message, const QString& rawLine = QString())
        : AniDBError(Protocol, message, code), m_rawLine(rawLine) {}
    QString rawLine() const { return m_rawLine; }
    void raise() const override { throw *this; }
    AniDBProtocolError* clone() const override { return new AniDBProtocolError(*this); }

private:
    QString m_rawLine;
};

#endif // ERRORS_H
