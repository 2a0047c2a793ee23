#include "TcpManagementTransport.hpp"
#include <QDebug>

namespace pyro {

TcpManagementTransport::TcpManagementTransport(QObject* parent)
    : IManagementTransport(parent)
    , socket_(new QTcpSocket(this))
{
    connect(socket_, &QTcpSocket::readyRead, this, [this]() {
        QByteArray data = socket_->readAll();
        qDebug() << "[TcpManagementTransport] readyRead:" << data.size() << "bytes";
        emit dataReceived(data);
    });
    connect(socket_, &QTcpSocket::disconnected, this, &TcpManagementTransport::disconnected);
    connect(socket_, &QAbstractSocket::errorOccurred, this, [this](QAbstractSocket::SocketError) {
        emit error(socket_->errorString());
    });
}

TcpManagementTransport::~TcpManagementTransport()
{
    disconnect(socket_, nullptr, this, nullptr);
    socket_->abort();
}

void TcpManagementTransport::connectToHost(const QString& host, quint16 port)
{
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();
    socket_->connectToHost(host, port);
}

bool TcpManagementTransport::waitForConnected(int timeoutMs)
{
    return socket_->waitForConnected(timeoutMs);
}

void TcpManagementTransport::close()
{
    if (socket_->state() == QAbstractSocket::UnconnectedState)
        return;
    socket_->close();
    if (socket_->state() != QAbstractSocket::UnconnectedState)
        socket_->abort();
}

bool TcpManagementTransport::write(const QByteArray& data)
{
    if (socket_->state() != QAbstractSocket::ConnectedState) {
        qWarning() << "[TcpManagementTransport] write DROPPED:" << data.size()
                   << "bytes (socket state:" << static_cast<int>(socket_->state()) << ")";
        return false;
    }
    if (socket_->write(data) != data.size())
        return false;
    socket_->flush();
    return true;
}

bool TcpManagementTransport::isConnected() const
{
    return socket_->state() == QAbstractSocket::ConnectedState;
}

} // namespace pyro
