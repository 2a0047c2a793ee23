#include "SessionController.hpp"
#include "ManagementParser.hpp"
#include <boost/log/trivial.hpp>

namespace pyro {

namespace {

// Subscriptions must be active before the hold is released, otherwise
// the first state and log messages are lost.
const char* const kHandshake[] = {"state on", "log on", "hold release"};

const QString kTerminateCommand = QStringLiteral("signal SIGTERM");

} // namespace

SessionController::SessionController(const SessionSettings& settings,
                                     IProcessLauncher* launcher,
                                     IManagementTransport* transport,
                                     QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , launcher_(launcher)
    , channel_(new ManagementChannel(transport, this))
    , stateToken_(sessionStateName(SessionState::Disconnected))
{
    launcher_->setParent(this);

    connect(channel_, &ManagementChannel::lineReceived, this, &SessionController::onLine);
    connect(channel_, &ManagementChannel::connectionLost, this, &SessionController::onConnectionLost);

    connect(launcher_, &IProcessLauncher::finished, this, &SessionController::onProcessFinished);
    connect(launcher_, &IProcessLauncher::errorOccurred, this, [](const QString& message) {
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] Process error: " << message.toStdString();
    });
    connect(launcher_, &IProcessLauncher::outputReceived, this, [](const QString& text) {
        BOOST_LOG_TRIVIAL(debug) << "[openvpn] " << text.toStdString();
    });
}

SessionController::~SessionController()
{
    disconnect(launcher_, nullptr, this, nullptr);
    disconnect(channel_, nullptr, this, nullptr);
}

SessionError SessionController::start(const QString& configPath)
{
    if (active_ || launcher_->isRunning() || channel_->isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] start(" << configPath.toStdString()
                                   << ") rejected: session already active";
        return SessionError::AlreadyConnectedError;
    }

    const QString program = settings_.program();
    BOOST_LOG_TRIVIAL(info) << "[SessionController] Starting session for " << configPath.toStdString();
    emit logLine(QStringLiteral("Starting OpenVPN with %1").arg(configPath));

    launcher_->start(program, settings_.arguments(configPath));
    if (!launcher_->waitForStarted(settings_.spawnTimeout)) {
        launcher_->kill();
        report(SessionError::ProcessSpawnError,
               QStringLiteral("Error: %1 did not start within %2 ms.")
                   .arg(program).arg(settings_.spawnTimeout));
        return SessionError::ProcessSpawnError;
    }
    setActive(true);

    const SessionError connectResult = channel_->connectToHost(
        settings_.managementHost, settings_.managementPort, settings_.connectTimeout);
    if (connectResult == SessionError::None && sendHandshake() == SessionError::None)
        return SessionError::None;

    // Best effort: the elevated child may outlive its wrapper
    setActive(false);
    channel_->disconnectFromHost();
    launcher_->kill();
    resetState();
    report(SessionError::ConnectionError,
           QStringLiteral("Error: Could not connect to OpenVPN management socket."));
    return SessionError::ConnectionError;
}

SessionError SessionController::sendHandshake()
{
    for (const char* command : kHandshake) {
        const SessionError result = channel_->send(QString::fromLatin1(command));
        if (result != SessionError::None)
            return result;
    }
    return SessionError::None;
}

void SessionController::stop()
{
    if (!active_ && !launcher_->isRunning() && !channel_->isConnected()
        && state_ == SessionState::Disconnected)
        return;

    stopping_ = true;
    BOOST_LOG_TRIVIAL(info) << "[SessionController] Stopping session";

    if (channel_->isConnected() && channel_->send(kTerminateCommand) != SessionError::None)
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] Could not deliver SIGTERM request";

    if (!launcher_->waitForFinished(settings_.stopTimeout)) {
        const QString warning = QStringLiteral("Warning: OpenVPN did not exit within %1 ms, forcing cleanup.")
                                    .arg(settings_.stopTimeout);
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] " << warning.toStdString();
        emit logLine(warning);
        launcher_->kill();
    }

    channel_->disconnectFromHost();
    resetState();
    setActive(false);
    stopping_ = false;
}

SessionError SessionController::submitCredentials(const QString& username, const QString& password)
{
    if (!channel_->isConnected()) {
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] Credentials submitted with no session";
        return SessionError::NotConnectedError;
    }

    if (hasLineBreak(username) || hasLineBreak(password) || hasLineBreak(settings_.credentialRealm)) {
        BOOST_LOG_TRIVIAL(warning) << "[SessionController] Credentials rejected: line break in value";
        return SessionError::InvalidArgumentError;
    }

    // Realm is always quoted on the wire
    const QString quotedRealm = quoteArgument(settings_.credentialRealm);

    SessionError result = channel_->send(
        QStringLiteral("username %1 %2").arg(quotedRealm, formatArgument(username)));
    if (result != SessionError::None)
        return result;

    result = channel_->send(
        QStringLiteral("password %1 %2").arg(quotedRealm, formatArgument(password)));
    if (result == SessionError::None)
        BOOST_LOG_TRIVIAL(info) << "[SessionController] Credentials sent for realm "
                                << settings_.credentialRealm.toStdString();
    return result;
}

bool SessionController::hasLineBreak(const QString& value)
{
    return value.contains('\n') || value.contains('\r');
}

QString SessionController::formatArgument(const QString& value)
{
    bool needsQuotes = value.isEmpty();
    for (const QChar c : value) {
        if (c.isSpace() || c == '"' || c == '\\') {
            needsQuotes = true;
            break;
        }
    }
    return needsQuotes ? quoteArgument(value) : value;
}

QString SessionController::quoteArgument(const QString& value)
{
    QString escaped = value;
    escaped.replace('\\', QStringLiteral("\\\\"));
    escaped.replace('"', QStringLiteral("\\\""));
    return QStringLiteral("\"%1\"").arg(escaped);
}

void SessionController::onLine(const QString& line)
{
    SessionError parseError = SessionError::None;
    const ManagementEvent event = ManagementParser::parseLine(line, &parseError);

    switch (event.type) {
    case ManagementEvent::Type::StateChanged:
        applyState(event.state, event.stateToken, event.peer);
        break;
    case ManagementEvent::Type::LogLine:
        emit logLine(event.text);
        break;
    case ManagementEvent::Type::CredentialRequested:
        BOOST_LOG_TRIVIAL(info) << "[SessionController] Credentials requested";
        emit credentialsRequested();
        break;
    case ManagementEvent::Type::None:
        if (parseError == SessionError::ProtocolParseError)
            BOOST_LOG_TRIVIAL(debug) << "[SessionController] Dropped malformed line";
        break;
    }
}

void SessionController::onConnectionLost(const QString& reason)
{
    if (stopping_)
        return;

    const QString message = QStringLiteral("Warning: lost connection to OpenVPN management interface (%1).")
                                .arg(reason);
    resetState();
    if (!launcher_->isRunning())
        setActive(false);
    report(SessionError::ConnectionError, message);
}

void SessionController::onProcessFinished(int exitCode)
{
    if (stopping_) {
        BOOST_LOG_TRIVIAL(info) << "[SessionController] OpenVPN exited with code " << exitCode;
        return;
    }
    if (!active_)
        return;

    emit logLine(QStringLiteral("OpenVPN exited with code %1.").arg(exitCode));
    channel_->disconnectFromHost();
    resetState();
    setActive(false);
}

void SessionController::applyState(SessionState state, const QString& token, const PeerInfo& peer)
{
    state_ = state;
    stateToken_ = token;
    peer_ = (state == SessionState::Connected) ? peer : PeerInfo{};

    BOOST_LOG_TRIVIAL(info) << "[SessionController] State: " << token.toStdString()
                            << (peer_.isEmpty() ? std::string()
                                                : " remote=" + peer_.remoteAddress.toStdString()
                                                      + " local=" + peer_.localAddress.toStdString());
    emit stateChanged(state_, peer_);
}

void SessionController::resetState()
{
    if (state_ == SessionState::Disconnected && peer_.isEmpty())
        return;
    applyState(SessionState::Disconnected, sessionStateName(SessionState::Disconnected), {});
}

void SessionController::setActive(bool active)
{
    if (active_ == active) return;
    active_ = active;
    emit activeChanged(active_);
}

void SessionController::report(SessionError error, const QString& message)
{
    BOOST_LOG_TRIVIAL(error) << "[SessionController] " << sessionErrorString(error).toStdString()
                             << ": " << message.toStdString();
    emit logLine(message);
    emit errorOccurred(error, message);
}

} // namespace pyro
