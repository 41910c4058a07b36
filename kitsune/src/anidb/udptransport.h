#ifndef UDPTRANSPORT_H
#define UDPTRANSPORT_H

#include "datagramtransport.h"
#include <QHostAddress>
#include <QList>

class QHostInfo;
class QUdpSocket;

/**
 * @brief DatagramTransport over a QUdpSocket
 *
 * open() binds the local port and starts an asynchronous lookup of the host
 * unless it is a literal address or was resolved before. Datagrams sent
 * before the lookup finishes are held and written once the socket is
 * connected to the resolved address, so only that peer's datagrams are
 * delivered. A failed lookup drops the held datagrams and emits
 * transportError().
 */
class UdpTransport : public DatagramTransport
{
    Q_OBJECT
public:
    UdpTransport(const QString &host, quint16 port, quint16 localPort, QObject *parent = nullptr);
    ~UdpTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;
    bool send(const QByteArray &datagram) override;
    QString errorString() const override { return m_error; }

    // True while the host lookup is still running
    bool isResolving() const { return m_lookupId != -1; }

private slots:
    void readPendingDatagrams();
    void onHostResolved(const QHostInfo &info);

private:
    void connectSocket();

    QString m_host;
    quint16 m_port;
    quint16 m_localPort;
    QHostAddress m_address;
    QUdpSocket *m_socket;
    QString m_error;
    int m_lookupId;
    QList<QByteArray> m_outbox;
};

#endif // UDPTRANSPORT_H
