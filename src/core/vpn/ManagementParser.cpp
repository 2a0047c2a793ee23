#include "ManagementParser.hpp"
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace pyro {

namespace {

const QString kStatePrefix = QStringLiteral(">STATE:");
const QString kLogPrefix = QStringLiteral(">LOG:");
const QString kPasswordPrefix = QStringLiteral(">PASSWORD:");

// >STATE:<ts>,<token>,<desc>,<local_ip>,<remote_ip>,...
constexpr int kStateTokenField = 1;
constexpr int kLocalAddressField = 3;
constexpr int kRemoteAddressField = 4;

void setError(SessionError* error, SessionError value)
{
    if (error) *error = value;
}

} // namespace

ManagementEvent ManagementParser::parseLine(const QString& line, SessionError* error)
{
    setError(error, SessionError::None);

    if (line.startsWith(kStatePrefix))
        return parseState(line.mid(kStatePrefix.size()), error);

    if (line.startsWith(kLogPrefix))
        return parseLog(line, error);

    if (line.startsWith(kPasswordPrefix)) {
        ManagementEvent event;
        event.type = ManagementEvent::Type::CredentialRequested;
        return event;
    }

    return {};
}

ManagementEvent ManagementParser::parseState(const QString& body, SessionError* error)
{
    const QStringList fields = body.split(',');
    if (fields.size() <= kStateTokenField) {
        BOOST_LOG_TRIVIAL(debug) << "[ManagementParser] STATE line without token dropped: "
                                 << body.toStdString();
        setError(error, SessionError::ProtocolParseError);
        return {};
    }

    ManagementEvent event;
    event.type = ManagementEvent::Type::StateChanged;
    event.stateToken = fields[kStateTokenField];
    event.state = sessionStateFromToken(event.stateToken);

    if (event.state == SessionState::Connected) {
        if (fields.size() <= kRemoteAddressField) {
            BOOST_LOG_TRIVIAL(debug) << "[ManagementParser] CONNECTED line missing addresses dropped: "
                                     << body.toStdString();
            setError(error, SessionError::ProtocolParseError);
            return {};
        }
        event.peer.localAddress = fields[kLocalAddressField];
        event.peer.remoteAddress = fields[kRemoteAddressField];
    }

    return event;
}

ManagementEvent ManagementParser::parseLog(const QString& line, SessionError* error)
{
    // At most three parts; the message keeps any commas of its own
    const int first = line.indexOf(',');
    const int second = first < 0 ? -1 : line.indexOf(',', first + 1);
    if (second < 0) {
        BOOST_LOG_TRIVIAL(debug) << "[ManagementParser] LOG line with fewer than 3 fields dropped: "
                                 << line.toStdString();
        setError(error, SessionError::ProtocolParseError);
        return {};
    }

    ManagementEvent event;
    event.type = ManagementEvent::Type::LogLine;
    event.text = line.mid(second + 1);
    return event;
}

} // namespace pyro
