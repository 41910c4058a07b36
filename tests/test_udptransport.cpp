#include <QtTest/QtTest>
#include <QUdpSocket>
#include "anidb/udptransport.h"

/**
 * UdpTransport against a loopback socket standing in for the server.
 */
class TestUdpTransport : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testLiteralAddressRoundTrip();
    void testHostNameResolvedAsynchronously();
    void testUnresolvableHostReportsError();
    void testCloseAbortsLookup();
    void testSendWhenClosed();

private:
    QByteArray receiveOnServer();

    QUdpSocket *m_server = nullptr;
};

void TestUdpTransport::init()
{
    m_server = new QUdpSocket(this);
    QVERIFY(m_server->bind(QHostAddress::LocalHost, 0));
}

void TestUdpTransport::cleanup()
{
    delete m_server;
    m_server = nullptr;
}

QByteArray TestUdpTransport::receiveOnServer()
{
    if (!QTest::qWaitFor([this]() { return m_server->hasPendingDatagrams(); }, 5000))
    {
        return QByteArray();
    }
    QByteArray data;
    data.resize(static_cast<int>(m_server->pendingDatagramSize()));
    QHostAddress sender;
    quint16 senderPort = 0;
    m_server->readDatagram(data.data(), data.size(), &sender, &senderPort);
    m_server->writeDatagram("1 300 PONG", sender, senderPort);
    return data;
}

void TestUdpTransport::testLiteralAddressRoundTrip()
{
    UdpTransport transport("127.0.0.1", m_server->localPort(), 0);
    QSignalSpy received(&transport, &DatagramTransport::datagramReceived);

    QVERIFY(transport.open());
    QVERIFY(transport.isOpen());
    QVERIFY(!transport.isResolving());

    QVERIFY(transport.send("PING tag=1"));
    QCOMPARE(receiveOnServer(), QByteArray("PING tag=1"));

    QTRY_COMPARE_WITH_TIMEOUT(received.count(), 1, 5000);
    QCOMPARE(received.at(0).at(0).toByteArray(), QByteArray("1 300 PONG"));
}

void TestUdpTransport::testHostNameResolvedAsynchronously()
{
    UdpTransport transport("localhost", m_server->localPort(), 0);
    QSignalSpy received(&transport, &DatagramTransport::datagramReceived);
    QSignalSpy errors(&transport, &DatagramTransport::transportError);

    QVERIFY(transport.open());
    QVERIFY(transport.isOpen());

    // Held until the lookup finishes, then written
    QVERIFY(transport.send("PING tag=1"));
    QCOMPARE(receiveOnServer(), QByteArray("PING tag=1"));
    QVERIFY(!transport.isResolving());

    QTRY_COMPARE_WITH_TIMEOUT(received.count(), 1, 5000);
    QCOMPARE(errors.count(), 0);
}

void TestUdpTransport::testUnresolvableHostReportsError()
{
    UdpTransport transport("kitsune-test.invalid", 9000, 0);
    QSignalSpy errors(&transport, &DatagramTransport::transportError);

    QVERIFY(transport.open());
    QVERIFY(transport.send("PING tag=1"));

    QVERIFY(errors.wait(30000) || errors.count() > 0);
    QCOMPARE(errors.count(), 1);
    QVERIFY(!transport.isResolving());
    QVERIFY(transport.errorString().contains("kitsune-test.invalid"));
    QVERIFY(errors.at(0).at(0).toString().contains("kitsune-test.invalid"));
}

void TestUdpTransport::testCloseAbortsLookup()
{
    UdpTransport transport("kitsune-test.invalid", 9000, 0);
    QSignalSpy errors(&transport, &DatagramTransport::transportError);

    QVERIFY(transport.open());
    transport.close();
    QVERIFY(!transport.isOpen());
    QVERIFY(!transport.isResolving());

    QTest::qWait(200);
    QCOMPARE(errors.count(), 0);
}

void TestUdpTransport::testSendWhenClosed()
{
    UdpTransport transport("127.0.0.1", m_server->localPort(), 0);
    QVERIFY(!transport.send("PING tag=1"));
    QVERIFY(!transport.errorString().isEmpty());
}

QTEST_MAIN(TestUdpTransport)
#include "test_udptransport.moc"
