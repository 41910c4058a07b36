#ifndef DATAGRAMTRANSPORT_H
#define DATAGRAMTRANSPORT_H

#include <QObject>
#include <QByteArray>
#include <QString>

/**
 * @brief One datagram endpoint talking to one fixed remote address
 *
 * send() only reports whether the OS accepted the datagram; UDP gives no
 * delivery guarantee. Every inbound datagram is emitted unchanged through
 * datagramReceived(). A failure found after open() returned (a host that
 * did not resolve, for instance) is reported through transportError().
 */
class DatagramTransport : public QObject
{
    Q_OBJECT
public:
    explicit DatagramTransport(QObject *parent = nullptr) : QObject(parent) {}
    ~DatagramTransport() override = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * @return true once the datagram was handed to the OS; on false see errorString()
     */
    virtual bool send(const QByteArray &datagram) = 0;

    virtual QString errorString() const = 0;

signals:
    void datagramReceived(QByteArray datagram);
    void transportError(QString message);
};

#endif // DATAGRAMTRANSPORT_H
