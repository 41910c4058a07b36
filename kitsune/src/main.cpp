#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSqlDatabase>
#include <QStandardPaths>
#include <QTextStream>
#include <functional>
#include <memory>
#include "anidb/anidbclient.h"
#include "clientsettings.h"
#include "futureutils.h"
#include "logger.h"
#include "hash/filestreamer.h"
#include "hash/multihashcalculator.h"

namespace
{

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printDigest(const QString &path, const ContentDigest &digest)
{
    out() << digest.ed2kLink(QFileInfo(path).fileName()) << '\n'
          << "  sha1  " << digest.sha1() << '\n'
          << "  md5   " << digest.md5() << '\n'
          << "  crc32 " << digest.crc32() << '\n';
    out().flush();
}

void printIdentification(const FileIdentification &result)
{
    printDigest(result.path, result.digest);
    if (!result.isKnown())
    {
        out() << "  AniDB: no such file\n";
    }
    else
    {
        const AniDBFileRecord &record = *result.record;
        out() << QString("  AniDB: fid %1, aid %2, eid %3, gid %4\n")
                     .arg(record.fileId()).arg(record.animeId()).arg(record.episodeId()).arg(record.groupId())
              << QString("  %1 - %2 - %3 [%4]%5\n")
                     .arg(record.animeNameRomaji(), record.episodeNumber(), record.episodeName(),
                          record.groupNameShort(),
                          record.isTruncated() ? QStringLiteral(" (reply truncated)") : QString());
    }
    out().flush();
}

QString defaultDatabasePath()
{
    const QString path = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    QDir().mkpath(path);
    return path + "/kitsune.sqlite";
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("kitsune");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Hash video files (ED2K, SHA-1, MD5, CRC-32) and identify them on AniDB");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("files", "Files to hash", "<file>...");

    QCommandLineOption identifyOption(QStringList() << "i" << "identify", "Look the files up on AniDB");
    QCommandLineOption databaseOption("db", "Settings database (SQLite)", "path");
    QCommandLineOption userOption("user", "AniDB username", "name");
    QCommandLineOption passwordOption("password", "AniDB password", "password");
    QCommandLineOption saveOption("save", "Store --user/--password in the settings database");
    QCommandLineOption serialOption("serial-io", "Read one file at a time (spinning disks)");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print log lines to stderr");
    parser.addOption(identifyOption);
    parser.addOption(databaseOption);
    parser.addOption(userOption);
    parser.addOption(passwordOption);
    parser.addOption(saveOption);
    parser.addOption(serialOption);
    parser.addOption(verboseOption);
    parser.process(app);

    const QStringList files = parser.positionalArguments();
    if (files.isEmpty())
    {
        parser.showHelp(1);
    }

    if (!parser.isSet(verboseOption))
    {
        QLoggingCategory::setFilterRules("default.debug=false");
    }

    FileStreamer::setSerializedIO(parser.isSet(serialOption));

    QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE");
    db.setDatabaseName(parser.isSet(databaseOption) ? parser.value(databaseOption) : defaultDatabasePath());
    if (!db.open())
    {
        LOG("[Main] Cannot open settings database " + db.databaseName() + ", using defaults");
    }

    ClientSettings settings(db);
    settings.ensureTable();
    settings.load();
    if (parser.isSet(userOption))
    {
        settings.auth().username = parser.value(userOption);
    }
    if (parser.isSet(passwordOption))
    {
        settings.auth().password = parser.value(passwordOption);
    }
    if (parser.isSet(saveOption) && !settings.save())
    {
        QTextStream(stderr) << "Could not save settings to " << db.databaseName() << '\n';
    }

    const bool identify = parser.isSet(identifyOption);
    if (identify && !settings.hasCredentials())
    {
        QTextStream(stderr) << "AniDB credentials missing: pass --user and --password (add --save to keep them)\n";
        return 2;
    }

    std::unique_ptr<AniDBClient> client;
    if (identify)
    {
        client = std::make_unique<AniDBClient>(settings);
        if (!client->open())
        {
            QTextStream(stderr) << "Cannot open UDP socket, see the log for details\n";
            return 1;
        }
    }

    auto failures = std::make_shared<int>(0);
    auto next = std::make_shared<std::function<void(int)>>();

    auto reportError = [failures](const QString &path, std::exception_ptr error)
    {
        ++*failures;
        QTextStream(stderr) << path << ": " << FutureUtils::errorMessage(error) << '\n';
    };

    auto finish = [&app, &client, failures]()
    {
        const int code = *failures > 0 ? 1 : 0;
        if (!client)
        {
            app.exit(code);
            return;
        }
        FutureUtils::observe(&app, client->close(),
            [&app, code]() { app.exit(code); },
            [&app, code](std::exception_ptr) { app.exit(code); });
    };

    *next = [&app, &client, files, identify, next, reportError, finish](int index)
    {
        if (index >= files.size())
        {
            finish();
            return;
        }
        const QString path = files.at(index);

        if (identify)
        {
            FutureUtils::observe(&app, client->identifyFile(path),
                [next, index](const FileIdentification &result)
                {
                    printIdentification(result);
                    (*next)(index + 1);
                },
                [next, index, path, reportError](std::exception_ptr error)
                {
                    reportError(path, error);
                    (*next)(index + 1);
                });
        }
        else
        {
            FutureUtils::observe(&app, MultiHashCalculator::computeContentDigest(path),
                [next, index, path](const ContentDigest &digest)
                {
                    printDigest(path, digest);
                    (*next)(index + 1);
                },
                [next, index, path, reportError](std::exception_ptr error)
                {
                    reportError(path, error);
                    (*next)(index + 1);
                });
        }
    };

    (*next)(0);
    const int result = app.exec();
    *next = nullptr;
    return result;
}
