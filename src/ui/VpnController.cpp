#include "VpnController.hpp"
#include "LogModel.hpp"
#include "core/profiles/ProfileStore.hpp"
#include "core/vpn/SessionController.hpp"
#include <boost/log/trivial.hpp>

namespace pyro {

VpnController::VpnController(SessionController* session, ProfileStore* store, LogModel* log,
                             QObject* parent)
    : QObject(parent), session_(session), store_(store), log_(log)
{
    connect(session_, &SessionController::stateChanged, this, [this]() { emit statusChanged(); });
    connect(session_, &SessionController::activeChanged, this, [this]() { emit activeChanged(); });
    connect(session_, &SessionController::logLine, log_, &LogModel::append);
    connect(session_, &SessionController::credentialsRequested, this, &VpnController::credentialsRequested);

    refreshProfiles();
}

QString VpnController::statusText() const
{
    return session_->stateToken();
}

QString VpnController::serverAddress() const
{
    const PeerInfo peer = session_->peerInfo();
    if (session_->state() != SessionState::Connected || peer.remoteAddress.isEmpty())
        return QString::fromLatin1(NOT_AVAILABLE);
    return peer.remoteAddress;
}

QString VpnController::localAddress() const
{
    const PeerInfo peer = session_->peerInfo();
    if (session_->state() != SessionState::Connected || peer.localAddress.isEmpty())
        return QString::fromLatin1(NOT_AVAILABLE);
    return peer.localAddress;
}

bool VpnController::isActive() const
{
    return session_->isActive();
}

QObject* VpnController::log() const
{
    return log_;
}

bool VpnController::connectProfile(const QString& name)
{
    if (name.isEmpty()) {
        emit messageRequested(tr("Error"), tr("Please select a configuration to connect."));
        return false;
    }

    const SessionError result = session_->start(store_->primaryConfigPath(name));
    switch (result) {
    case SessionError::None:
        return true;
    case SessionError::AlreadyConnectedError:
        emit messageRequested(tr("Error"), tr("A VPN session is already active. Disconnect first."));
        return false;
    default:
        // The controller already logged the cause
        return false;
    }
}

void VpnController::disconnectSession()
{
    session_->stop();
}

bool VpnController::importProfile(const QUrl& fileUrl)
{
    const QString path = fileUrl.isLocalFile() ? fileUrl.toLocalFile() : fileUrl.toString();
    if (path.isEmpty())
        return false;

    QString error;
    if (!store_->ensureRoot()) {
        emit messageRequested(tr("Error"), tr("Cannot create %1").arg(store_->rootDir()));
        return false;
    }
    const QString name = store_->importProfile(path, &error);
    if (name.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[VpnController] Import failed: " << error.toStdString();
        emit messageRequested(tr("Error"), error);
        return false;
    }

    refreshProfiles();
    emit messageRequested(tr("Success"), tr("Configuration '%1' imported successfully.").arg(name));
    return true;
}

bool VpnController::submitCredentials(const QString& username, const QString& password)
{
    const SessionError result = session_->submitCredentials(username, password);
    if (result != SessionError::None) {
        log_->append(QStringLiteral("Error: credentials not sent (%1).").arg(sessionErrorString(result)));
        return false;
    }
    return true;
}

void VpnController::refreshProfiles()
{
    const QStringList names = store_->list();
    if (names == profiles_) return;
    profiles_ = names;
    emit profilesChanged();
}

} // namespace pyro
