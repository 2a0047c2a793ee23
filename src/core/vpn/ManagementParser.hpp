#pragma once

#include "ManagementEvent.hpp"
#include "SessionError.hpp"
#include <QString>

namespace pyro {

/// Stateless interpreter for OpenVPN management-interface lines.
/// Dispatches on the line prefix; unknown prefixes produce no event.
class ManagementParser {
public:
    /// Parse one line (already stripped of its terminator).
    /// Malformed known messages return an invalid event and set
    /// *error to ProtocolParseError; unknown lines leave *error at None.
    static ManagementEvent parseLine(const QString& line, SessionError* error = nullptr);

private:
    static ManagementEvent parseState(const QString& body, SessionError* error);
    static ManagementEvent parseLog(const QString& line, SessionError* error);
};

} // namespace pyro
