#pragma once

#include <QString>
#include <yaml-cpp/yaml.h>
#include <cstdint>

namespace pyro {

class YamlConfig {
public:
    YamlConfig();

    /// Merge the file over the built-in defaults.
    /// Returns false (defaults kept) if the file is missing or malformed.
    bool load(const QString& filePath);
    bool save(const QString& filePath) const;

    // OpenVPN process
    QString openvpnBinary() const;
    void setOpenvpnBinary(const QString& v);
    QString elevationCommand() const;
    void setElevationCommand(const QString& v);

    // Management interface
    QString managementHost() const;
    void setManagementHost(const QString& v);
    uint16_t managementPort() const;
    void setManagementPort(uint16_t v);

    // Timeouts (ms)
    int spawnTimeoutMs() const;
    void setSpawnTimeoutMs(int v);
    int connectTimeoutMs() const;
    void setConnectTimeoutMs(int v);
    int stopTimeoutMs() const;
    void setStopTimeoutMs(int v);

    // Credentials
    QString credentialRealm() const;
    void setCredentialRealm(const QString& v);

    // Profiles
    QString profilesDirectory() const;  // "~" expanded
    void setProfilesDirectory(const QString& v);
    QString profileExtension() const;
    void setProfileExtension(const QString& v);

    // UI
    int logMaxLines() const;
    void setLogMaxLines(int v);

    // Logging
    QString logLevel() const;
    void setLogLevel(const QString& v);

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace pyro
