#pragma once

#include "IProcessLauncher.hpp"

namespace pyro {

/// Scripted launcher for tests; never spawns anything.
class ReplayProcessLauncher : public IProcessLauncher {
    Q_OBJECT
public:
    explicit ReplayProcessLauncher(QObject* parent = nullptr);
    ~ReplayProcessLauncher() override;

    // IProcessLauncher interface
    void start(const QString& program, const QStringList& arguments) override;
    bool waitForStarted(int timeoutMs) override;
    bool waitForFinished(int timeoutMs) override;
    bool isRunning() const override;
    void kill() override;

    // Test API
    void setStartSucceeds(bool ok) { startSucceeds_ = ok; }
    /// When false, waitForFinished() times out and the process keeps running.
    void setExitsOnRequest(bool exits) { exitsOnRequest_ = exits; }
    void simulateExit(int exitCode);
    QString lastProgram() const { return lastProgram_; }
    QStringList lastArguments() const { return lastArguments_; }
    int startCount() const { return startCount_; }
    int killCount() const { return killCount_; }

private:
    bool startSucceeds_ = true;
    bool exitsOnRequest_ = true;
    bool pendingStart_ = false;
    bool running_ = false;
    int startCount_ = 0;
    int killCount_ = 0;
    QString lastProgram_;
    QStringList lastArguments_;
};

} // namespace pyro
