#pragma once

#include <QMetaType>
#include <QString>

namespace pyro {

enum class SessionError {
    None,
    ProcessSpawnError,      // process did not start within the spawn timeout
    ConnectionError,        // management channel unreachable or lost
    ProtocolParseError,     // malformed management line (dropped)
    AlreadyConnectedError,  // start() while a session is active
    NotConnectedError,      // send with no management channel
    InvalidArgumentError    // value would break the one-line command framing
};

QString sessionErrorString(SessionError error);

} // namespace pyro

Q_DECLARE_METATYPE(pyro::SessionError)
