#include "SessionSettings.hpp"
#include "core/YamlConfig.hpp"
#include <boost/log/trivial.hpp>

namespace pyro {

namespace {

// QProcess treats -1 as "wait forever"
int boundedTimeout(const char* key, int value)
{
    if (value > 0)
        return value;
    BOOST_LOG_TRIVIAL(warning) << "[SessionSettings] timeouts." << key << " = " << value
                               << " is not positive, using " << SessionSettings::DEFAULT_TIMEOUT_MS;
    return SessionSettings::DEFAULT_TIMEOUT_MS;
}

} // namespace

SessionSettings SessionSettings::fromConfig(const YamlConfig& config)
{
    SessionSettings s;
    s.openvpnBinary = config.openvpnBinary();
    s.elevationCommand = config.elevationCommand().trimmed();
    s.managementHost = config.managementHost();
    s.managementPort = config.managementPort();
    s.spawnTimeout = boundedTimeout("spawn_ms", config.spawnTimeoutMs());
    s.connectTimeout = boundedTimeout("connect_ms", config.connectTimeoutMs());
    s.stopTimeout = boundedTimeout("stop_ms", config.stopTimeoutMs());
    s.credentialRealm = config.credentialRealm();
    return s;
}

QString SessionSettings::program() const
{
    return elevationCommand.isEmpty() ? openvpnBinary : elevationCommand;
}

QStringList SessionSettings::arguments(const QString& configPath) const
{
    QStringList args;
    if (!elevationCommand.isEmpty())
        args << openvpnBinary;
    args << "--config" << configPath
         << "--management" << managementHost << QString::number(managementPort);
    return args;
}

} // namespace pyro
