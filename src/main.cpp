#include <signal.h>
#include <QGuiApplication>
#include <QQmlApplicationEngine>
#include <QQmlContext>
#include <QQuickStyle>
#include <QDir>
#include <QFile>
#include <memory>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/profiles/ProfileStore.hpp"
#include "core/vpn/QProcessLauncher.hpp"
#include "core/vpn/SessionController.hpp"
#include "core/vpn/SessionSettings.hpp"
#include "core/vpn/TcpManagementTransport.hpp"
#include "ui/LogModel.hpp"
#include "ui/VpnController.hpp"

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);
    app.setApplicationName("Pyro VPN");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Pyro");

    qRegisterMetaType<pyro::SessionState>();
    qRegisterMetaType<pyro::PeerInfo>();
    qRegisterMetaType<pyro::SessionError>();

    // Load YAML config; write defaults on first run
    const QString configDir = QDir::homePath() + "/.pyro";
    const QString yamlPath = configDir + "/config.yaml";
    auto yamlConfig = std::make_shared<pyro::YamlConfig>();
    if (QFile::exists(yamlPath)) {
        if (!yamlConfig->load(yamlPath))
            qWarning() << "Config: could not load" << yamlPath << "- using defaults";
    } else {
        QDir().mkpath(configDir);
        if (!yamlConfig->save(yamlPath))
            qWarning() << "Config: could not write defaults to" << yamlPath;
    }

    pyro::initLogging(yamlConfig->logLevel());
    BOOST_LOG_TRIVIAL(info) << "Pyro VPN " << app.applicationVersion().toStdString()
                            << " starting, config " << yamlPath.toStdString();

    // --- Profiles ---
    auto profileStore = std::make_unique<pyro::ProfileStore>(
        yamlConfig->profilesDirectory(), yamlConfig->profileExtension());
    if (!profileStore->ensureRoot())
        qWarning() << "Profiles: cannot create" << profileStore->rootDir();

    // --- Session ---
    auto* session = new pyro::SessionController(
        pyro::SessionSettings::fromConfig(*yamlConfig),
        new pyro::QProcessLauncher(),
        new pyro::TcpManagementTransport(),
        &app);

    auto* logModel = new pyro::LogModel(yamlConfig->logMaxLines(), &app);
    auto* vpnController = new pyro::VpnController(session, profileStore.get(), logModel, &app);

    // Never leave an elevated OpenVPN behind on exit
    QObject::connect(&app, &QCoreApplication::aboutToQuit, session, [session]() {
        session->stop();
    });

    QQuickStyle::setStyle("Material");

    QQmlApplicationEngine engine;
    engine.rootContext()->setContextProperty("VpnController", vpnController);
    engine.rootContext()->setContextProperty("LogModel", logModel);

    // Qt 6.5+ uses /qt/qml/ prefix, Qt 6.4 uses direct URI prefix
    QUrl url(QStringLiteral("qrc:/PyroVpn/main.qml"));
    if (QFile::exists(QStringLiteral(":/qt/qml/PyroVpn/main.qml")))
        url = QUrl(QStringLiteral("qrc:/qt/qml/PyroVpn/main.qml"));

    engine.load(url);

    if (engine.rootObjects().isEmpty())
        return -1;

    // SIGUSR1 → tear down the VPN session, keep the window open
    static pyro::SessionController* g_session = session;
    signal(SIGUSR1, [](int) {
        QMetaObject::invokeMethod(g_session, [](){ g_session->stop(); },
                                   Qt::QueuedConnection);
    });

    return app.exec();
}
