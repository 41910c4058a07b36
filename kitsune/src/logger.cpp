#include "logger.h"
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <cassert>

// The instance lives for the whole process, it is never deleted.
static Logger* s_instance = nullptr;
static QMutex s_instanceMutex;

static QMutex s_sinkMutex;
static Logger::Sink s_sink;

Logger::Logger() : QObject(nullptr)
{
}

Logger* Logger::instance()
{
    if (!s_instance)
    {
        QMutexLocker locker(&s_instanceMutex);
        if (!s_instance)
        {
            s_instance = new Logger();
        }
    }
    return s_instance;
}

void Logger::setSink(Sink sink)
{
    QMutexLocker locker(&s_sinkMutex);
    s_sink = std::move(sink);
}

QString Logger::redact(const QString &secret)
{
    if (secret.isEmpty())
    {
        return secret;
    }
    // At most 2 characters, and never more than half of the secret
    return secret.left(qMin(2, secret.length() / 2)) + "...";
}

void Logger::log(const QString &msg, const QString &file, int line)
{
    assert(!file.isEmpty() && "Logger::log: file parameter is empty");
    assert(line > 0 && "Logger::log: line parameter invalid");

    QString fullMessage;
    if (!file.isEmpty() && line > 0)
    {
        QString filename = file;
        int lastSlash = filename.lastIndexOf('/');
        if (lastSlash == -1)
        {
            lastSlash = filename.lastIndexOf('\\');
        }
        if (lastSlash >= 0)
        {
            filename = filename.mid(lastSlash + 1);
        }

        fullMessage = QString("[%1:%2] %3").arg(filename).arg(line).arg(msg);
    }
    else
    {
        fullMessage = msg;
    }

    qDebug().noquote() << fullMessage;

    // Copy the sink so a slow sink does not hold the lock
    Sink sink;
    {
        QMutexLocker locker(&s_sinkMutex);
        sink = s_sink;
    }
    if (sink)
    {
        sink(fullMessage);
    }

    emit instance()->logMessage(fullMessage);
}
