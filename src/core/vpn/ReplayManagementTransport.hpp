#pragma once

#include "IManagementTransport.hpp"
#include <QList>

namespace pyro {

/// In-memory transport for tests: records writes, replays inbound bytes.
class ReplayManagementTransport : public IManagementTransport {
    Q_OBJECT
public:
    explicit ReplayManagementTransport(QObject* parent = nullptr);
    ~ReplayManagementTransport() override;

    // IManagementTransport interface
    void connectToHost(const QString& host, quint16 port) override;
    bool waitForConnected(int timeoutMs) override;
    void close() override;
    bool write(const QByteArray& data) override;
    bool isConnected() const override;

    // Test API
    void setAcceptConnections(bool accept) { accept_ = accept; }
    void feedData(const QByteArray& data);
    void simulateDisconnect();
    QList<QByteArray> writtenData() const { return written_; }
    QByteArray writtenBytes() const;
    void clearWritten() { written_.clear(); }
    int connectAttempts() const { return connectAttempts_; }
    QString lastHost() const { return lastHost_; }
    quint16 lastPort() const { return lastPort_; }

private:
    bool accept_ = true;
    bool pending_ = false;
    bool connected_ = false;
    int connectAttempts_ = 0;
    QString lastHost_;
    quint16 lastPort_ = 0;
    QList<QByteArray> written_;
};

} // namespace pyro
