#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

namespace pyro {

/// Spawns and supervises one external process. Elevation is expressed by
/// the caller as a wrapper program (e.g. pkexec) in front of the command.
class IProcessLauncher : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~IProcessLauncher() override = default;

    virtual void start(const QString& program, const QStringList& arguments) = 0;
    virtual bool waitForStarted(int timeoutMs) = 0;
    virtual bool waitForFinished(int timeoutMs) = 0;
    virtual bool isRunning() const = 0;
    virtual void kill() = 0;

signals:
    void started();
    void finished(int exitCode);
    void errorOccurred(const QString& message);
    void outputReceived(const QString& text);
};

} // namespace pyro
