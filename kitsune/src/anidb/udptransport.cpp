#include "udptransport.h"
#include "../logger.h"
#include <QUdpSocket>
#include <QHostInfo>

UdpTransport::UdpTransport(const QString &host, quint16 port, quint16 localPort, QObject *parent)
    : DatagramTransport(parent)
    , m_host(host)
    , m_port(port)
    , m_localPort(localPort)
    , m_socket(nullptr)
    , m_lookupId(-1)
{
}

UdpTransport::~UdpTransport()
{
    close();
}

bool UdpTransport::open()
{
    if (m_socket != nullptr)
    {
        return true;
    }

    m_socket = new QUdpSocket(this);
    if (!m_socket->bind(QHostAddress::AnyIPv4, m_localPort))
    {
        m_error = QString("Can't bind UDP port %1: %2").arg(m_localPort).arg(m_socket->errorString());
        LOG("[AniDB Transport] " + m_error);
        delete m_socket;
        m_socket = nullptr;
        return false;
    }
    LOG(QString("[AniDB Transport] UDP socket bound to port %1").arg(m_socket->localPort()));

    if (m_address.isNull())
    {
        QHostAddress literal;
        if (literal.setAddress(m_host))
        {
            m_address = literal;
        }
        else
        {
            LOG(QString("[AniDB Transport] Resolving %1").arg(m_host));
            m_lookupId = QHostInfo::lookupHost(m_host, this, &UdpTransport::onHostResolved);
            return true;
        }
    }

    connectSocket();
    return true;
}

void UdpTransport::onHostResolved(const QHostInfo &info)
{
    if (info.lookupId() != m_lookupId)
    {
        return;
    }
    m_lookupId = -1;

    if (info.error() != QHostInfo::NoError || info.addresses().isEmpty())
    {
        m_error = QString("DNS resolution for %1 failed: %2").arg(m_host, info.errorString());
        LOG("[AniDB Transport] " + m_error);
        if (!m_outbox.isEmpty())
        {
            LOG(QString("[AniDB Transport] Dropping %1 queued datagram(s)").arg(m_outbox.size()));
            m_outbox.clear();
        }
        emit transportError(m_error);
        return;
    }

    // Prefer IPv4, the socket is bound to AnyIPv4
    m_address = info.addresses().first();
    for (const QHostAddress &address : info.addresses())
    {
        if (address.protocol() == QAbstractSocket::IPv4Protocol)
        {
            m_address = address;
            break;
        }
    }
    LOG(QString("[AniDB Transport] %1 resolved to %2").arg(m_host, m_address.toString()));

    if (m_socket != nullptr)
    {
        connectSocket();
    }
}

void UdpTransport::connectSocket()
{
    m_socket->connectToHost(m_address, m_port);
    connect(m_socket, &QUdpSocket::readyRead, this, &UdpTransport::readPendingDatagrams);
    LOG(QString("[AniDB Transport] Peer %1:%2").arg(m_address.toString()).arg(m_port));

    const QList<QByteArray> queued = m_outbox;
    m_outbox.clear();
    for (const QByteArray &datagram : queued)
    {
        if (!send(datagram))
        {
            LOG("[AniDB Transport] Queued datagram not sent: " + m_error);
            emit transportError(m_error);
            return;
        }
    }
}

void UdpTransport::close()
{
    if (m_lookupId != -1)
    {
        QHostInfo::abortHostLookup(m_lookupId);
        m_lookupId = -1;
    }
    m_outbox.clear();

    if (m_socket == nullptr)
    {
        return;
    }
    m_socket->disconnect(this);
    m_socket->close();
    m_socket->deleteLater();
    m_socket = nullptr;
    LOG("[AniDB Transport] UDP socket released");
}

bool UdpTransport::isOpen() const
{
    return m_socket != nullptr && m_socket->isValid();
}

bool UdpTransport::send(const QByteArray &datagram)
{
    if (!isOpen())
    {
        m_error = QStringLiteral("Socket is not open");
        return false;
    }

    if (m_lookupId != -1)
    {
        m_outbox.append(datagram);
        return true;
    }

    const qint64 written = m_socket->write(datagram);
    if (written != datagram.size())
    {
        m_error = m_socket->errorString();
        return false;
    }
    return true;
}

void UdpTransport::readPendingDatagrams()
{
    while (m_socket != nullptr && m_socket->hasPendingDatagrams())
    {
        QByteArray data;
        data.resize(static_cast<int>(m_socket->pendingDatagramSize()));
        const qint64 bytesRead = m_socket->readDatagram(data.data(), data.size());
        if (bytesRead < 0)
        {
            LOG("[AniDB Transport] readDatagram failed: " + m_socket->errorString());
            continue;
        }
        data.resize(static_cast<int>(bytesRead));
        emit datagramReceived(data);
    }
}
