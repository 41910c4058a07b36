#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QObject>
#include <functional>

/**
 * Unified logging for Kitsune
 *
 * Every line is:
 * - written to the console (qDebug)
 * - emitted through the logMessage signal
 * - forwarded to the optional sink function installed by the host application
 *
 * The core never needs anything more specific than "a function callable with
 * a string", so an embedding application can route lines anywhere by calling
 * Logger::setSink().
 *
 * Usage:
 *   LOG("Your message here");
 *   LOG(QString("Formatted %1 message %2").arg(var1).arg(var2));
 */
class Logger : public QObject
{
    Q_OBJECT

public:
    using Sink = std::function<void(const QString &)>;

    /**
     * Main logging function
     *
     * @param msg The message to log
     * @param file Source file name, must not be empty (use the LOG macro)
     * @param line Source line number, must be > 0 (use the LOG macro)
     */
    static void log(const QString &msg, const QString &file, int line);

    /**
     * Install a sink that receives every formatted line.
     * Pass an empty function to remove it.
     */
    static void setSink(Sink sink);

    /**
     * Shorten a secret (session key) for display: at most the first 2 characters + "...", whatever its length
     */
    static QString redact(const QString &secret);

    static Logger* instance();

signals:
    void logMessage(QString message);

private:
    Logger();
};

#define LOG(msg) Logger::log(msg, __FILE__, __LINE__)

#endif // LOGGER_H
