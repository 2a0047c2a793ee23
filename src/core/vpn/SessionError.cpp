#include "SessionError.hpp"

namespace pyro {

QString sessionErrorString(SessionError error)
{
    switch (error) {
    case SessionError::None:
        return QStringLiteral("No error");
    case SessionError::ProcessSpawnError:
        return QStringLiteral("OpenVPN process failed to start");
    case SessionError::ConnectionError:
        return QStringLiteral("Management interface unreachable");
    case SessionError::ProtocolParseError:
        return QStringLiteral("Malformed management message");
    case SessionError::AlreadyConnectedError:
        return QStringLiteral("A session is already active");
    case SessionError::NotConnectedError:
        return QStringLiteral("Management interface not connected");
    case SessionError::InvalidArgumentError:
        return QStringLiteral("Value contains a line break");
    }
    return QStringLiteral("Unknown error");
}

} // namespace pyro
