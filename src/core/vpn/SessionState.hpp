#pragma once

#include <QMetaType>
#include <QString>

namespace pyro {

enum class SessionState {
    Disconnected,
    Connecting,
    Waiting,        // credential prompt or management hold
    Connected,
    Reconnecting,
    Exiting,
    Unknown         // token not recognised; raw token is kept alongside
};

/// Tunnel endpoints reported by a CONNECTED state line.
struct PeerInfo {
    QString remoteAddress;
    QString localAddress;

    bool isEmpty() const { return remoteAddress.isEmpty() && localAddress.isEmpty(); }
    bool operator==(const PeerInfo& other) const
    {
        return remoteAddress == other.remoteAddress && localAddress == other.localAddress;
    }
    bool operator!=(const PeerInfo& other) const { return !(*this == other); }
};

/// Map an OpenVPN state token (e.g. "CONNECTED", "GET_CONFIG") to a SessionState.
SessionState sessionStateFromToken(const QString& token);

/// Upper-case name matching the OpenVPN token for the canonical states.
QString sessionStateName(SessionState state);

} // namespace pyro

Q_DECLARE_METATYPE(pyro::SessionState)
Q_DECLARE_METATYPE(pyro::PeerInfo)
