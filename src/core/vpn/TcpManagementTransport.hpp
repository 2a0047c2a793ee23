#pragma once

#include "IManagementTransport.hpp"
#include <QTcpSocket>

namespace pyro {

class TcpManagementTransport : public IManagementTransport {
    Q_OBJECT
public:
    explicit TcpManagementTransport(QObject* parent = nullptr);
    ~TcpManagementTransport() override;

    void connectToHost(const QString& host, quint16 port) override;
    bool waitForConnected(int timeoutMs) override;
    void close() override;
    bool write(const QByteArray& data) override;
    bool isConnected() const override;

private:
    QTcpSocket* socket_;
};

} // namespace pyro
