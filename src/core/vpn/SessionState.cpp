#include "SessionState.hpp"
#include <QHash>

namespace pyro {

SessionState sessionStateFromToken(const QString& token)
{
    static const QHash<QString, SessionState> tokens = {
        {"CONNECTING",   SessionState::Connecting},
        {"RESOLVE",      SessionState::Connecting},
        {"TCP_CONNECT",  SessionState::Connecting},
        {"GET_CONFIG",   SessionState::Connecting},
        {"ASSIGN_IP",    SessionState::Connecting},
        {"ADD_ROUTES",   SessionState::Connecting},
        {"WAIT",         SessionState::Waiting},
        {"AUTH",         SessionState::Waiting},
        {"AUTH_PENDING", SessionState::Waiting},
        {"HOLD",         SessionState::Waiting},
        {"CONNECTED",    SessionState::Connected},
        {"RECONNECTING", SessionState::Reconnecting},
        {"EXITING",      SessionState::Exiting},
        {"DISCONNECTED", SessionState::Disconnected},
    };
    return tokens.value(token, SessionState::Unknown);
}

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Disconnected: return QStringLiteral("DISCONNECTED");
    case SessionState::Connecting:   return QStringLiteral("CONNECTING");
    case SessionState::Waiting:      return QStringLiteral("WAIT");
    case SessionState::Connected:    return QStringLiteral("CONNECTED");
    case SessionState::Reconnecting: return QStringLiteral("RECONNECTING");
    case SessionState::Exiting:      return QStringLiteral("EXITING");
    case SessionState::Unknown:      break;
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace pyro
