#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

namespace pyro {

/// Byte stream to the OpenVPN management endpoint.
class IManagementTransport : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IManagementTransport() override = default;

    virtual void connectToHost(const QString& host, quint16 port) = 0;
    /// Block until connected, refused, or timeoutMs elapsed.
    virtual bool waitForConnected(int timeoutMs) = 0;
    virtual void close() = 0;
    virtual bool write(const QByteArray& data) = 0;
    virtual bool isConnected() const = 0;

signals:
    void dataReceived(const QByteArray& data);
    void disconnected();
    void error(const QString& message);
};

} // namespace pyro
