#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <QUrl>
#include "core/vpn/SessionError.hpp"
#include "core/vpn/SessionState.hpp"

namespace pyro {

class SessionController;
class ProfileStore;
class LogModel;

/// QML bridge for the main window: profile list, connection status and the
/// user actions that drive the SessionController.
class VpnController : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString statusText READ statusText NOTIFY statusChanged)
    Q_PROPERTY(QString serverAddress READ serverAddress NOTIFY statusChanged)
    Q_PROPERTY(QString localAddress READ localAddress NOTIFY statusChanged)
    Q_PROPERTY(bool active READ isActive NOTIFY activeChanged)
    Q_PROPERTY(QStringList profiles READ profiles NOTIFY profilesChanged)
    Q_PROPERTY(QObject* log READ log CONSTANT)

public:
    static constexpr const char* NOT_AVAILABLE = "N/A";

    VpnController(SessionController* session, ProfileStore* store, LogModel* log,
                  QObject* parent = nullptr);

    QString statusText() const;
    QString serverAddress() const;
    QString localAddress() const;
    bool isActive() const;
    QStringList profiles() const { return profiles_; }
    QObject* log() const;

    Q_INVOKABLE bool connectProfile(const QString& name);
    Q_INVOKABLE void disconnectSession();
    Q_INVOKABLE bool importProfile(const QUrl& fileUrl);
    Q_INVOKABLE bool submitCredentials(const QString& username, const QString& password);
    Q_INVOKABLE void refreshProfiles();

signals:
    void statusChanged();
    void activeChanged();
    void profilesChanged();
    void credentialsRequested();
    void messageRequested(const QString& title, const QString& text);

private:
    SessionController* session_;
    ProfileStore* store_;
    LogModel* log_;
    QStringList profiles_;
};

} // namespace pyro
