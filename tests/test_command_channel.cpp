#include <QtTest/QtTest>
#include "anidb/anidbcommandchannel.h"
#include "clock.h"
#include "errors.h"
#include "fakedatagramtransport.h"
#include "manualclock.h"

/**
 * Tagging, correlation, timeouts, bans and pacing of the command channel.
 *
 * Most cases run with zero intervals and a manual clock so nothing waits;
 * the pacing cases use real timers.
 */
class TestCommandChannel : public QObject
{
    Q_OBJECT

private slots:
    // Wire form
    void testBuildCommand();
    void testTagsIncrement();

    // Correlation
    void testOutOfOrderReplies();
    void testUnknownTagDropped();
    void testTaglessReplyDropped();
    void testMalformedReplyWithKnownTag();
    void testErrorCodesReturnedToCaller();

    // Failures
    void testTimeoutRemovesOnlyItsEntry();
    void testLateReplyAfterTimeoutDropped();
    void testSendFailure();
    void testOpenFailure();
    void testCloseFailsPending();
    void testTransportErrorFailsPending();
    void testNonPositiveTimeoutUsesDefault();

    // Ban
    void testBanReplyBlocksFurtherSends();
    void testTaglessBanStillRecorded();

    // Pacing
    void testRealTimeSpacing();
    void testCloseDropsQueuedCommands();

private:
    template <typename E, typename T>
    static bool failsWith(QFuture<T> future)
    {
        try
        {
            future.waitForFinished();
        }
        catch (const E &)
        {
            return true;
        }
        catch (const std::exception &e)
        {
            qWarning() << "unexpected exception:" << e.what();
            return false;
        }
        return false;
    }
};

// ===== Wire form =====

void TestCommandChannel::testBuildCommand()
{
    AniDBCommandChannel::Params params;
    params << qMakePair(QString("s"), QString("abc"))
           << qMakePair(QString("ed2k"), QString("x y&z"));
    QCOMPARE(AniDBCommandChannel::buildCommand("FILE", params, "7"),
             QByteArray("FILE s=abc&ed2k=x%20y%26z&tag=7"));
    QCOMPARE(AniDBCommandChannel::buildCommand("PING", AniDBCommandChannel::Params(), "1"),
             QByteArray("PING tag=1"));
}

void TestCommandChannel::testTagsIncrement()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> f1 = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QFuture<AniDBReply> f2 = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QFuture<AniDBReply> f3 = channel.sendCommand("UPTIME", AniDBCommandChannel::Params());

    QCOMPARE(transport.sent.size(), 3);
    QCOMPARE(transport.sent.at(0).tag, QString("1"));
    QCOMPARE(transport.sent.at(1).tag, QString("2"));
    QCOMPARE(transport.sent.at(2).tag, QString("3"));
    QCOMPARE(transport.sent.at(2).datagram, QByteArray("UPTIME tag=3"));
    QCOMPARE(channel.pendingCount(), 3);
    QCOMPARE(transport.openCount, 1);

    channel.close();
    QVERIFY(failsWith<AniDBTransportError>(f1));
    QVERIFY(failsWith<AniDBTransportError>(f2));
    QVERIFY(failsWith<AniDBTransportError>(f3));
}

// ===== Correlation =====

void TestCommandChannel::testOutOfOrderReplies()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> first = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QFuture<AniDBReply> second = channel.sendCommand("UPTIME", AniDBCommandChannel::Params());

    transport.deliver("2 208 UPTIME\n123456");
    QVERIFY(second.isFinished());
    QVERIFY(!first.isFinished());

    transport.deliver("1 300 PONG");
    QVERIFY(first.isFinished());

    QCOMPARE(first.result().code, QString("300"));
    QCOMPARE(second.result().code, QString("208"));
    QCOMPARE(second.result().payloadLines, QStringList() << "123456");
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testUnknownTagDropped()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    transport.deliver("99 300 PONG");

    QVERIFY(!future.isFinished());
    QCOMPARE(channel.pendingCount(), 1);

    transport.deliver("1 300 PONG");
    QVERIFY(future.isFinished());
    QCOMPARE(future.result().tag, QString("1"));

    // Duplicate of an answered reply
    transport.deliver("1 300 PONG");
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testTaglessReplyDropped()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    transport.deliver("598 UNKNOWN COMMAND");

    QVERIFY(!future.isFinished());
    QCOMPARE(channel.pendingCount(), 1);
    QVERIFY(!channel.banGuard().isBanned());
    channel.close();
}

void TestCommandChannel::testMalformedReplyWithKnownTag()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    transport.deliver("1 garbage without a code");

    QVERIFY(future.isFinished());
    try
    {
        future.waitForFinished();
        QFAIL("expected AniDBProtocolError");
    }
    catch (const AniDBProtocolError &e)
    {
        QCOMPARE(e.kind(), AniDBError::Protocol);
        QCOMPARE(e.rawLine(), QString("1 garbage without a code"));
    }
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testErrorCodesReturnedToCaller()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    // Interpreting 5xx codes other than bans belongs to the caller
    QFuture<AniDBReply> future = channel.sendCommand("FILE", AniDBCommandChannel::Params(), RateLimiter::File);
    transport.deliver("1 506 INVALID SESSION");
    QVERIFY(future.isFinished());
    QCOMPARE(future.result().code, QString("506"));
    QCOMPARE(future.result().message, QString("INVALID SESSION"));
}

// ===== Failures =====

void TestCommandChannel::testTimeoutRemovesOnlyItsEntry()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> shortLived = channel.sendCommand("PING", AniDBCommandChannel::Params(),
                                                         RateLimiter::General, 50);
    QFuture<AniDBReply> longLived = channel.sendCommand("UPTIME", AniDBCommandChannel::Params());

    QTRY_VERIFY_WITH_TIMEOUT(shortLived.isFinished(), 5000);
    QVERIFY(!longLived.isFinished());
    QCOMPARE(channel.pendingCount(), 1);

    try
    {
        shortLived.waitForFinished();
        QFAIL("expected AniDBTimeoutError");
    }
    catch (const AniDBTimeoutError &e)
    {
        QCOMPARE(e.command(), QString("PING"));
        QCOMPARE(e.tag(), QString("1"));
    }

    transport.deliver("2 208 UPTIME\n1");
    QVERIFY(longLived.isFinished());
    QCOMPARE(longLived.result().code, QString("208"));
}

void TestCommandChannel::testLateReplyAfterTimeoutDropped()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 30);

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QCOMPARE(channel.commandTimeoutMs(), 30);
    QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 5000);
    QVERIFY(failsWith<AniDBTimeoutError>(future));

    transport.deliver("1 300 PONG");
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testSendFailure()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);
    transport.failSend = true;

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QVERIFY(future.isFinished());
    QVERIFY(failsWith<AniDBTransportError>(future));
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testOpenFailure()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);
    transport.failOpen = true;

    QVERIFY(!channel.open());
    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QVERIFY(failsWith<AniDBTransportError>(future));
    QCOMPARE(transport.sentCount(), 0);
}

void TestCommandChannel::testCloseFailsPending()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> future = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QVERIFY(channel.isOpen());

    channel.close();
    QVERIFY(future.isFinished());
    QVERIFY(failsWith<AniDBTransportError>(future));
    QVERIFY(!channel.isOpen());
    QCOMPARE(transport.closeCount, 1);
    QCOMPARE(channel.pendingCount(), 0);

    // Reopens on demand
    QFuture<AniDBReply> again = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QCOMPARE(transport.openCount, 2);
    transport.deliver(QByteArray("2 300 PONG"));
    QCOMPARE(again.result().code, QString("300"));
}

void TestCommandChannel::testTransportErrorFailsPending()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> first = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QFuture<AniDBReply> second = channel.sendCommand("UPTIME", AniDBCommandChannel::Params());
    QCOMPARE(channel.pendingCount(), 2);

    transport.raiseError("DNS resolution for api.anidb.net failed");
    QVERIFY(first.isFinished());
    QVERIFY(second.isFinished());
    QVERIFY(failsWith<AniDBTransportError>(first));
    QVERIFY(failsWith<AniDBTransportError>(second));
    QCOMPARE(channel.pendingCount(), 0);
    QVERIFY(!transport.isOpen());
    QCOMPARE(transport.closeCount, 1);

    // A late reply to a failed command is ignored
    transport.deliver(QByteArray("1 300 PONG"));
    QCOMPARE(channel.pendingCount(), 0);
}

void TestCommandChannel::testNonPositiveTimeoutUsesDefault()
{
    FakeDatagramTransport transport;
    ManualClock clock;

    AniDBCommandChannel zero(&transport, &clock, 0, 0, 60000, 0);
    QCOMPARE(zero.commandTimeoutMs(), AniDBCommandChannel::DEFAULT_COMMAND_TIMEOUT_MS);

    AniDBCommandChannel negative(&transport, &clock, 0, 0, 60000, -5);
    QCOMPARE(negative.commandTimeoutMs(), 30000);

    AniDBCommandChannel custom(&transport, &clock, 0, 0, 60000, 1500);
    QCOMPARE(custom.commandTimeoutMs(), 1500);
}

// ===== Ban =====

void TestCommandChannel::testBanReplyBlocksFurtherSends()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    QFuture<AniDBReply> banned = channel.sendCommand("PING", AniDBCommandChannel::Params());
    transport.deliver("1 555 BANNED\nleeching");

    try
    {
        banned.waitForFinished();
        QFAIL("expected AniDBBannedError");
    }
    catch (const AniDBBannedError &e)
    {
        QCOMPARE(e.reason(), QString("leeching"));
        QCOMPARE(e.expiresAtMs(), clock.nowMs() + 60000);
    }
    QVERIFY(channel.banGuard().isBanned());

    QFuture<AniDBReply> blocked = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QVERIFY(failsWith<AniDBBannedError>(blocked));
    QCOMPARE(transport.sentCount(), 1);

    clock.advance(60000);
    QFuture<AniDBReply> allowed = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QCOMPARE(transport.sentCount(), 2);
    transport.deliver("2 300 PONG");
    QCOMPARE(allowed.result().code, QString("300"));
}

void TestCommandChannel::testTaglessBanStillRecorded()
{
    FakeDatagramTransport transport;
    ManualClock clock;
    AniDBCommandChannel channel(&transport, &clock, 0, 0, 60000, 5000);

    transport.open();
    transport.deliver("504 CLIENT BANNED - too many requests");
    QVERIFY(channel.banGuard().isBanned());
    QCOMPARE(channel.banGuard().reason(), QString("CLIENT BANNED - too many requests"));

    QVERIFY(failsWith<AniDBBannedError>(channel.sendCommand("PING", AniDBCommandChannel::Params())));
    QCOMPARE(transport.sentCount(), 0);
}

// ===== Pacing =====

void TestCommandChannel::testRealTimeSpacing()
{
    FakeDatagramTransport transport;
    SystemClock clock;
    AniDBCommandChannel channel(&transport, &clock, 2000, 4000, 60000, 30000);
    transport.responder = [](const QString &, const QString &tag, const QByteArray &)
    {
        return QList<QByteArray>() << QString("%1 300 PONG").arg(tag).toUtf8();
    };

    QList<QFuture<AniDBReply>> futures;
    futures << channel.sendCommand("PING", AniDBCommandChannel::Params())
            << channel.sendCommand("PING", AniDBCommandChannel::Params())
            << channel.sendCommand("FILE", AniDBCommandChannel::Params(), RateLimiter::File)
            << channel.sendCommand("FILE", AniDBCommandChannel::Params(), RateLimiter::File);

    QCOMPARE(transport.sentCount(), 1);
    QTRY_COMPARE_WITH_TIMEOUT(transport.sentCount(), 4, 20000);

    // Timer resolution slack between the wall clock and the monotonic one
    const qint64 slack = 2;
    const QList<FakeDatagramTransport::Sent> sent = transport.sent;
    QVERIFY(sent.at(1).elapsedMs - sent.at(0).elapsedMs >= 2000 - slack);
    QVERIFY(sent.at(2).elapsedMs - sent.at(1).elapsedMs >= 2000 - slack);
    QVERIFY(sent.at(3).elapsedMs - sent.at(2).elapsedMs >= 4000 - slack);

    for (const QFuture<AniDBReply> &future : futures)
    {
        QTRY_VERIFY_WITH_TIMEOUT(future.isFinished(), 5000);
        QCOMPARE(future.result().code, QString("300"));
    }
}

void TestCommandChannel::testCloseDropsQueuedCommands()
{
    FakeDatagramTransport transport;
    SystemClock clock;
    AniDBCommandChannel channel(&transport, &clock, 500, 1000, 60000, 30000);

    QFuture<AniDBReply> first = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QFuture<AniDBReply> queued = channel.sendCommand("PING", AniDBCommandChannel::Params());
    QCOMPARE(transport.sentCount(), 1);

    channel.close();
    QVERIFY(failsWith<AniDBTransportError>(first));
    QVERIFY(queued.isFinished());
    QVERIFY(failsWith<AniDBTransportError>(queued));

    // The slot timer still fires but must not send
    QTest::qWait(800);
    QCOMPARE(transport.sentCount(), 1);
    QVERIFY(!transport.isOpen());
}

QTEST_MAIN(TestCommandChannel)
#include "test_command_channel.moc"
