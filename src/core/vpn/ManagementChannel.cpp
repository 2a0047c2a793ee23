#include "ManagementChannel.hpp"
#include <QElapsedTimer>
#include <QThread>
#include <boost/log/trivial.hpp>

namespace pyro {

namespace {

// Credentials must not reach the diagnostic log
std::string redacted(const QString& command)
{
    if (command.startsWith(QStringLiteral("password ")))
        return "password <redacted>";
    return command.toStdString();
}

} // namespace

ManagementChannel::ManagementChannel(IManagementTransport* transport, QObject* parent)
    : QObject(parent)
    , transport_(transport)
{
    transport_->setParent(this);
    connect(transport_, &IManagementTransport::dataReceived,
            this, &ManagementChannel::onData);
    connect(transport_, &IManagementTransport::disconnected,
            this, &ManagementChannel::onTransportDisconnected);
    connect(transport_, &IManagementTransport::error,
            this, &ManagementChannel::onTransportError);
}

ManagementChannel::~ManagementChannel()
{
    disconnectFromHost();
}

SessionError ManagementChannel::connectToHost(const QString& host, quint16 port, int timeoutMs)
{
    if (isConnected())
        return SessionError::None;

    ++generation_;
    framer_.clear();
    inbox_.clear();
    lastError_.clear();

    QElapsedTimer timer;
    timer.start();
    int attempts = 0;

    while (true) {
        ++attempts;
        transport_->connectToHost(host, port);
        const int remaining = static_cast<int>(qMax<qint64>(0, timeoutMs - timer.elapsed()));
        if (transport_->waitForConnected(remaining))
            break;

        closing_ = true;
        transport_->close();
        closing_ = false;

        const qint64 left = timeoutMs - timer.elapsed();
        if (left <= 0) {
            BOOST_LOG_TRIVIAL(error) << "[ManagementChannel] " << host.toStdString() << ":" << port
                                     << " unreachable after " << attempts << " attempt(s): "
                                     << lastError_.toStdString();
            return SessionError::ConnectionError;
        }
        QThread::msleep(static_cast<unsigned long>(qMin<qint64>(RETRY_INTERVAL_MS, left)));
    }

    listening_ = true;
    lastError_.clear();
    BOOST_LOG_TRIVIAL(info) << "[ManagementChannel] Connected to " << host.toStdString()
                            << ":" << port << " (attempt " << attempts << ")";
    return SessionError::None;
}

SessionError ManagementChannel::send(const QString& command)
{
    if (!isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "[ManagementChannel] Not connected, dropping command: "
                                   << redacted(command);
        return SessionError::NotConnectedError;
    }

    BOOST_LOG_TRIVIAL(debug) << "[ManagementChannel] -> " << redacted(command);
    if (!transport_->write(command.toUtf8() + '\n'))
        return SessionError::ConnectionError;
    return SessionError::None;
}

void ManagementChannel::disconnectFromHost()
{
    const bool wasListening = listening_;
    listening_ = false;
    ++generation_;

    closing_ = true;
    transport_->close();
    closing_ = false;

    framer_.clear();
    inbox_.clear();

    if (wasListening)
        BOOST_LOG_TRIVIAL(info) << "[ManagementChannel] Disconnected";
}

bool ManagementChannel::isConnected() const
{
    return listening_ && transport_->isConnected();
}

void ManagementChannel::onData(const QByteArray& data)
{
    if (!listening_)
        return;

    inbox_.append(data);
    if (delivering_)
        return;

    delivering_ = true;
    while (listening_ && !inbox_.isEmpty()) {
        const quint64 generation = generation_;
        const QList<QByteArray> lines = framer_.feed(inbox_.takeFirst());
        for (const auto& line : lines) {
            emit lineReceived(QString::fromUtf8(line));
            // A handler may have torn the channel down or reopened it;
            // the rest of this batch belongs to the old connection
            if (generation_ != generation)
                break;
        }
    }
    delivering_ = false;
}

void ManagementChannel::onTransportDisconnected()
{
    if (closing_ || !listening_)
        return;

    listening_ = false;
    framer_.clear();
    inbox_.clear();

    const QString reason = lastError_.isEmpty()
        ? QStringLiteral("Management connection closed by OpenVPN")
        : lastError_;
    BOOST_LOG_TRIVIAL(warning) << "[ManagementChannel] Connection lost: " << reason.toStdString();
    emit connectionLost(reason);
}

void ManagementChannel::onTransportError(const QString& message)
{
    lastError_ = message;
    if (listening_)
        BOOST_LOG_TRIVIAL(warning) << "[ManagementChannel] Transport error: " << message.toStdString();
}

} // namespace pyro
