#pragma once

#include "SessionState.hpp"
#include <QString>

namespace pyro {

/// One interpreted management-interface line.
struct ManagementEvent {
    enum class Type {
        None,                 // unrecognised or dropped line
        StateChanged,
        LogLine,
        CredentialRequested
    };

    Type type = Type::None;

    // StateChanged
    SessionState state = SessionState::Disconnected;
    QString stateToken;
    PeerInfo peer;            // filled only when state == Connected

    // LogLine
    QString text;

    bool isValid() const { return type != Type::None; }
};

} // namespace pyro
