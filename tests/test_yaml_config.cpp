#include <QtTest>
#include <QTemporaryDir>
#include "core/YamlConfig.hpp"
#include "core/vpn/SessionSettings.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testLoadMissingFile();
    void testLoadMalformedFileKeepsDefaults();
    void testSaveAndReload();
    void testProfilesDirectoryExpandsHome();
    void testSessionSettingsFromConfig();
    void testNonPositiveTimeoutsFallBack();
    void testOutOfRangePortFallsBack();
};

void TestYamlConfig::testLoadDefaults()
{
    pyro::YamlConfig config;
    QCOMPARE(config.openvpnBinary(), QString("openvpn"));
    QCOMPARE(config.elevationCommand(), QString("pkexec"));
    QCOMPARE(config.managementHost(), QString("127.0.0.1"));
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(7505));
    QCOMPARE(config.spawnTimeoutMs(), 2000);
    QCOMPARE(config.connectTimeoutMs(), 2000);
    QCOMPARE(config.stopTimeoutMs(), 2000);
    QCOMPARE(config.credentialRealm(), QString("Auth"));
    QCOMPARE(config.profileExtension(), QString("ovpn"));
    QCOMPARE(config.logMaxLines(), 1000);
    QCOMPARE(config.logLevel(), QString("info"));
}

void TestYamlConfig::testLoadFromFile()
{
    pyro::YamlConfig config;
    QVERIFY(config.load(QString(TEST_DATA_DIR) + "/test_config.yaml"));

    QCOMPARE(config.openvpnBinary(), QString("/usr/sbin/openvpn"));
    QCOMPARE(config.elevationCommand(), QString());
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(17505));
    QCOMPARE(config.connectTimeoutMs(), 5000);
    QCOMPARE(config.credentialRealm(), QString("Corporate Auth"));
    QCOMPARE(config.logMaxLines(), 250);
    QCOMPARE(config.logLevel(), QString("debug"));

    // Keys absent from the file keep their defaults
    QCOMPARE(config.managementHost(), QString("127.0.0.1"));
    QCOMPARE(config.spawnTimeoutMs(), 2000);
    QCOMPARE(config.profileExtension(), QString("ovpn"));
}

void TestYamlConfig::testLoadMissingFile()
{
    pyro::YamlConfig config;
    config.setManagementPort(9000);
    QVERIFY(!config.load("/nonexistent/pyro/config.yaml"));
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(7505));
}

void TestYamlConfig::testLoadMalformedFileKeepsDefaults()
{
    pyro::YamlConfig config;
    QVERIFY(!config.load(QString(TEST_DATA_DIR) + "/broken_config.yaml"));
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(7505));
    QCOMPARE(config.managementHost(), QString("127.0.0.1"));
}

void TestYamlConfig::testSaveAndReload()
{
    pyro::YamlConfig config;
    config.setManagementPort(7600);
    config.setElevationCommand("sudo");
    config.setCredentialRealm("Private Key");

    QString tmpPath = QDir::tempPath() + "/pyro_test_config.yaml";
    QVERIFY(config.save(tmpPath));

    pyro::YamlConfig reloaded;
    QVERIFY(reloaded.load(tmpPath));
    QCOMPARE(reloaded.managementPort(), static_cast<uint16_t>(7600));
    QCOMPARE(reloaded.elevationCommand(), QString("sudo"));
    QCOMPARE(reloaded.credentialRealm(), QString("Private Key"));
    QCOMPARE(reloaded.openvpnBinary(), QString("openvpn"));

    QFile::remove(tmpPath);
}

void TestYamlConfig::testProfilesDirectoryExpandsHome()
{
    pyro::YamlConfig config;
    QCOMPARE(config.profilesDirectory(), QDir::homePath() + "/.openvpn-gui/configs");

    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");
    QCOMPARE(config.profilesDirectory(), QDir::homePath() + "/vpn-profiles");

    config.setProfilesDirectory("/srv/vpn");
    QCOMPARE(config.profilesDirectory(), QString("/srv/vpn"));
}

void TestYamlConfig::testSessionSettingsFromConfig()
{
    pyro::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    auto settings = pyro::SessionSettings::fromConfig(config);
    QCOMPARE(settings.program(), QString("/usr/sbin/openvpn"));
    QCOMPARE(settings.managementPort, static_cast<uint16_t>(17505));
    QCOMPARE(settings.connectTimeout, 5000);
    QCOMPARE(settings.credentialRealm, QString("Corporate Auth"));
    QCOMPARE(settings.arguments("/tmp/a.ovpn"),
             QStringList({"--config", "/tmp/a.ovpn", "--management", "127.0.0.1", "17505"}));
}

void TestYamlConfig::testNonPositiveTimeoutsFallBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("timeouts.yaml");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("timeouts:\n  spawn_ms: 0\n  connect_ms: 1500\n  stop_ms: -1\n");
    file.close();

    pyro::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.stopTimeoutMs(), -1);

    auto settings = pyro::SessionSettings::fromConfig(config);
    QCOMPARE(settings.stopTimeout, pyro::SessionSettings::DEFAULT_TIMEOUT_MS);
    QCOMPARE(settings.spawnTimeout, pyro::SessionSettings::DEFAULT_TIMEOUT_MS);
    QCOMPARE(settings.connectTimeout, 1500);
}

void TestYamlConfig::testOutOfRangePortFallsBack()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath("port.yaml");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Text));
    file.write("management:\n  port: 70000\n");
    file.close();

    pyro::YamlConfig config;
    QVERIFY(config.load(path));
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(7505));

    config.setManagementPort(0);
    QCOMPARE(config.managementPort(), static_cast<uint16_t>(7505));
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
