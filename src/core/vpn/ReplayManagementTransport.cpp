#include "ReplayManagementTransport.hpp"

namespace pyro {

ReplayManagementTransport::ReplayManagementTransport(QObject* parent)
    : IManagementTransport(parent)
{
}

ReplayManagementTransport::~ReplayManagementTransport() = default;

void ReplayManagementTransport::connectToHost(const QString& host, quint16 port)
{
    ++connectAttempts_;
    lastHost_ = host;
    lastPort_ = port;
    pending_ = true;
}

bool ReplayManagementTransport::waitForConnected(int timeoutMs)
{
    Q_UNUSED(timeoutMs)
    if (!pending_) return connected_;
    pending_ = false;
    connected_ = accept_;
    if (!connected_)
        emit error(QStringLiteral("Connection refused"));
    return connected_;
}

void ReplayManagementTransport::close()
{
    pending_ = false;
    if (!connected_) return;
    connected_ = false;
    emit disconnected();
}

bool ReplayManagementTransport::write(const QByteArray& data)
{
    if (!connected_) return false;
    written_.append(data);
    return true;
}

bool ReplayManagementTransport::isConnected() const
{
    return connected_;
}

QByteArray ReplayManagementTransport::writtenBytes() const
{
    QByteArray all;
    for (const auto& chunk : written_)
        all += chunk;
    return all;
}

void ReplayManagementTransport::feedData(const QByteArray& data)
{
    emit dataReceived(data);
}

void ReplayManagementTransport::simulateDisconnect()
{
    connected_ = false;
    emit disconnected();
}

} // namespace pyro
