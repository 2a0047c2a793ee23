#pragma once

#include "IManagementTransport.hpp"
#include "LineFramer.hpp"
#include "SessionError.hpp"
#include <QObject>
#include <QList>

namespace pyro {

/// Client side of the OpenVPN management interface: connects a transport,
/// frames inbound bytes into lines and sends newline-terminated commands.
///
/// Line delivery is non-reentrant. Data arriving while lineReceived
/// handlers run is queued and framed after the current batch.
class ManagementChannel : public QObject {
    Q_OBJECT
public:
    static constexpr int RETRY_INTERVAL_MS = 100;

    /// Takes ownership of the transport.
    explicit ManagementChannel(IManagementTransport* transport, QObject* parent = nullptr);
    ~ManagementChannel() override;

    /// Connect, retrying refused attempts until timeoutMs has elapsed.
    SessionError connectToHost(const QString& host, quint16 port, int timeoutMs);

    /// Write command + '\n'. NotConnectedError when no channel is open.
    SessionError send(const QString& command);

    /// Close the transport and drop any partial line. Idempotent.
    void disconnectFromHost();

    bool isConnected() const;
    QByteArray pendingBytes() const { return framer_.pending(); }
    IManagementTransport* transport() const { return transport_; }

public slots:
    void onData(const QByteArray& data);

signals:
    void lineReceived(const QString& line);
    /// The peer closed the channel or it failed while connected.
    void connectionLost(const QString& reason);

private:
    void onTransportDisconnected();
    void onTransportError(const QString& message);

    IManagementTransport* transport_;
    LineFramer framer_;
    QList<QByteArray> inbox_;
    QString lastError_;
    quint64 generation_ = 0;   // bumped on every connect and disconnect
    bool listening_ = false;
    bool delivering_ = false;
    bool closing_ = false;
};

} // namespace pyro
