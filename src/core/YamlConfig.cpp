#include "core/YamlConfig.hpp"
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>
#include <fstream>

namespace pyro {

namespace {

// Deep merge: maps recurse, scalars and sequences from the overlay win,
// keys missing from the overlay keep the base value.
YAML::Node mergeOver(const YAML::Node& base, const YAML::Node& overlay)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);
    if (!base.IsDefined() || base.IsNull() || !base.IsMap() || !overlay.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        result[key] = result[key] ? mergeOver(result[key], it->second)
                                  : YAML::Clone(it->second);
    }
    return result;
}

QString expandHome(const QString& path)
{
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

} // namespace

YamlConfig::YamlConfig()
{
    initDefaults();
}

void YamlConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["openvpn"]["binary"] = "openvpn";
    root_["openvpn"]["elevation"] = "pkexec";

    root_["management"]["host"] = "127.0.0.1";
    root_["management"]["port"] = 7505;

    root_["timeouts"]["spawn_ms"] = 2000;
    root_["timeouts"]["connect_ms"] = 2000;
    root_["timeouts"]["stop_ms"] = 2000;

    root_["credentials"]["realm"] = "Auth";

    root_["profiles"]["directory"] = "~/.openvpn-gui/configs";
    root_["profiles"]["extension"] = "ovpn";

    root_["ui"]["log_max_lines"] = 1000;

    root_["logging"]["level"] = "info";
}

bool YamlConfig::load(const QString& filePath)
{
    initDefaults();
    if (!QFile::exists(filePath)) {
        BOOST_LOG_TRIVIAL(debug) << "Config file does not exist: " << filePath.toStdString();
        return false;
    }

    try {
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeOver(root_, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Failed to parse " << filePath.toStdString()
                                 << ": " << e.what() << " (using defaults)";
        initDefaults();
        return false;
    }
    return true;
}

bool YamlConfig::save(const QString& filePath) const
{
    std::ofstream fout(filePath.toStdString());
    if (!fout) {
        BOOST_LOG_TRIVIAL(error) << "Cannot write config file " << filePath.toStdString();
        return false;
    }
    fout << root_ << "\n";
    return fout.good();
}

// --- OpenVPN process ---

QString YamlConfig::openvpnBinary() const
{
    return QString::fromStdString(root_["openvpn"]["binary"].as<std::string>("openvpn"));
}

void YamlConfig::setOpenvpnBinary(const QString& v)
{
    root_["openvpn"]["binary"] = v.toStdString();
}

QString YamlConfig::elevationCommand() const
{
    return QString::fromStdString(root_["openvpn"]["elevation"].as<std::string>("pkexec"));
}

void YamlConfig::setElevationCommand(const QString& v)
{
    root_["openvpn"]["elevation"] = v.toStdString();
}

// --- Management interface ---

QString YamlConfig::managementHost() const
{
    return QString::fromStdString(root_["management"]["host"].as<std::string>("127.0.0.1"));
}

void YamlConfig::setManagementHost(const QString& v)
{
    root_["management"]["host"] = v.toStdString();
}

uint16_t YamlConfig::managementPort() const
{
    const int port = root_["management"]["port"].as<int>(7505);
    if (port < 1 || port > 65535) {
        BOOST_LOG_TRIVIAL(warning) << "management.port " << port << " out of range, using 7505";
        return 7505;
    }
    return static_cast<uint16_t>(port);
}

void YamlConfig::setManagementPort(uint16_t v)
{
    root_["management"]["port"] = static_cast<int>(v);
}

// --- Timeouts ---

int YamlConfig::spawnTimeoutMs() const
{
    return root_["timeouts"]["spawn_ms"].as<int>(2000);
}

void YamlConfig::setSpawnTimeoutMs(int v)
{
    root_["timeouts"]["spawn_ms"] = v;
}

int YamlConfig::connectTimeoutMs() const
{
    return root_["timeouts"]["connect_ms"].as<int>(2000);
}

void YamlConfig::setConnectTimeoutMs(int v)
{
    root_["timeouts"]["connect_ms"] = v;
}

int YamlConfig::stopTimeoutMs() const
{
    return root_["timeouts"]["stop_ms"].as<int>(2000);
}

void YamlConfig::setStopTimeoutMs(int v)
{
    root_["timeouts"]["stop_ms"] = v;
}

// --- Credentials ---

QString YamlConfig::credentialRealm() const
{
    return QString::fromStdString(root_["credentials"]["realm"].as<std::string>("Auth"));
}

void YamlConfig::setCredentialRealm(const QString& v)
{
    root_["credentials"]["realm"] = v.toStdString();
}

// --- Profiles ---

QString YamlConfig::profilesDirectory() const
{
    return expandHome(QString::fromStdString(
        root_["profiles"]["directory"].as<std::string>("~/.openvpn-gui/configs")));
}

void YamlConfig::setProfilesDirectory(const QString& v)
{
    root_["profiles"]["directory"] = v.toStdString();
}

QString YamlConfig::profileExtension() const
{
    return QString::fromStdString(root_["profiles"]["extension"].as<std::string>("ovpn"));
}

void YamlConfig::setProfileExtension(const QString& v)
{
    root_["profiles"]["extension"] = v.toStdString();
}

// --- UI ---

int YamlConfig::logMaxLines() const
{
    return root_["ui"]["log_max_lines"].as<int>(1000);
}

void YamlConfig::setLogMaxLines(int v)
{
    root_["ui"]["log_max_lines"] = v;
}

// --- Logging ---

QString YamlConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

void YamlConfig::setLogLevel(const QString& v)
{
    root_["logging"]["level"] = v.toStdString();
}

} // namespace pyro
