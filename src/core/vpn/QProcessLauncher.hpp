#pragma once

#include "IProcessLauncher.hpp"
#include <QProcess>

namespace pyro {

class QProcessLauncher : public IProcessLauncher {
    Q_OBJECT
public:
    explicit QProcessLauncher(QObject* parent = nullptr);
    ~QProcessLauncher() override;

    void start(const QString& program, const QStringList& arguments) override;
    bool waitForStarted(int timeoutMs) override;
    bool waitForFinished(int timeoutMs) override;
    bool isRunning() const override;
    void kill() override;

private:
    QProcess* process_;
};

} // namespace pyro
