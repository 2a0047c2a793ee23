#include "ReplayProcessLauncher.hpp"

namespace pyro {

ReplayProcessLauncher::ReplayProcessLauncher(QObject* parent)
    : IProcessLauncher(parent)
{
}

ReplayProcessLauncher::~ReplayProcessLauncher() = default;

void ReplayProcessLauncher::start(const QString& program, const QStringList& arguments)
{
    ++startCount_;
    lastProgram_ = program;
    lastArguments_ = arguments;
    pendingStart_ = true;
}

bool ReplayProcessLauncher::waitForStarted(int timeoutMs)
{
    Q_UNUSED(timeoutMs)
    if (!pendingStart_) return running_;
    pendingStart_ = false;

    if (!startSucceeds_) {
        emit errorOccurred(QStringLiteral("Process failed to start"));
        return false;
    }
    running_ = true;
    emit started();
    return true;
}

bool ReplayProcessLauncher::waitForFinished(int timeoutMs)
{
    Q_UNUSED(timeoutMs)
    if (!running_) return true;
    if (!exitsOnRequest_) return false;
    simulateExit(0);
    return true;
}

bool ReplayProcessLauncher::isRunning() const
{
    return running_ || pendingStart_;
}

void ReplayProcessLauncher::kill()
{
    ++killCount_;
    pendingStart_ = false;
    if (running_)
        simulateExit(9);
}

void ReplayProcessLauncher::simulateExit(int exitCode)
{
    if (!running_) return;
    running_ = false;
    emit finished(exitCode);
}

} // namespace pyro
