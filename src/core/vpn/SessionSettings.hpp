#pragma once

#include <QString>
#include <QStringList>
#include <cstdint>

namespace pyro {

class YamlConfig;

struct SessionSettings {
    static constexpr int DEFAULT_TIMEOUT_MS = 2000;

    QString openvpnBinary = "openvpn";
    QString elevationCommand = "pkexec";   // empty = run the binary directly

    QString managementHost = "127.0.0.1";
    uint16_t managementPort = 7505;

    // Timeouts (ms), always positive when built by fromConfig()
    int spawnTimeout = DEFAULT_TIMEOUT_MS;
    int connectTimeout = DEFAULT_TIMEOUT_MS;
    int stopTimeout = DEFAULT_TIMEOUT_MS;

    QString credentialRealm = "Auth";

    static SessionSettings fromConfig(const YamlConfig& config);

    /// Program to spawn: the elevation wrapper if set, else the binary.
    QString program() const;
    /// Full argument list for program(), ending in the --management endpoint.
    QStringList arguments(const QString& configPath) const;
};

} // namespace pyro
