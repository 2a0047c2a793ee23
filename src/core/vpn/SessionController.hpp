#pragma once

#include "IManagementTransport.hpp"
#include "IProcessLauncher.hpp"
#include "ManagementChannel.hpp"
#include "SessionError.hpp"
#include "SessionSettings.hpp"
#include "SessionState.hpp"
#include <QObject>

namespace pyro {

/// Owns one OpenVPN session: spawns the (elevated) process, connects to its
/// management interface, performs the startup handshake and turns management
/// messages into state changes, log lines and credential prompts.
///
/// Only one session may be active at a time. All handling runs on the
/// owning thread's event loop; start() and stop() block for at most their
/// configured timeouts.
class SessionController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool active READ isActive NOTIFY activeChanged)

public:
    /// Takes ownership of launcher and transport.
    SessionController(const SessionSettings& settings,
                      IProcessLauncher* launcher,
                      IManagementTransport* transport,
                      QObject* parent = nullptr);
    ~SessionController() override;

    /// Spawn OpenVPN for configPath and attach to its management interface.
    SessionError start(const QString& configPath);

    /// Ask OpenVPN to exit, wait up to the stop timeout, then tear down
    /// locally whether or not the exit was confirmed.
    void stop();

    /// Answer a credential prompt (username first, then password).
    SessionError submitCredentials(const QString& username, const QString& password);

    SessionState state() const { return state_; }
    QString stateToken() const { return stateToken_; }
    PeerInfo peerInfo() const { return peer_; }
    bool isActive() const { return active_; }

    const SessionSettings& settings() const { return settings_; }
    ManagementChannel* channel() const { return channel_; }

    /// Management-interface string argument: bare if safe, else quoted
    /// with '"' and '\' escaped.
    static QString formatArgument(const QString& value);
    static QString quoteArgument(const QString& value);
    static bool hasLineBreak(const QString& value);

signals:
    void stateChanged(pyro::SessionState state, const pyro::PeerInfo& peer);
    void logLine(const QString& text);
    void credentialsRequested();
    void errorOccurred(pyro::SessionError error, const QString& message);
    void activeChanged(bool active);

private:
    void onLine(const QString& line);
    void onConnectionLost(const QString& reason);
    void onProcessFinished(int exitCode);

    void applyState(SessionState state, const QString& token, const PeerInfo& peer);
    void resetState();
    void setActive(bool active);
    void report(SessionError error, const QString& message);
    SessionError sendHandshake();

    SessionSettings settings_;
    IProcessLauncher* launcher_;
    ManagementChannel* channel_;

    SessionState state_ = SessionState::Disconnected;
    QString stateToken_;
    PeerInfo peer_;
    bool active_ = false;
    bool stopping_ = false;
};

} // namespace pyro
