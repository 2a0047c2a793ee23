#include "QProcessLauncher.hpp"
#include <boost/log/trivial.hpp>

namespace pyro {

QProcessLauncher::QProcessLauncher(QObject* parent)
    : IProcessLauncher(parent)
    , process_(new QProcess(this))
{
    process_->setProcessChannelMode(QProcess::MergedChannels);

    connect(process_, &QProcess::started, this, &QProcessLauncher::started);
    connect(process_, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus status) {
        BOOST_LOG_TRIVIAL(info) << "[QProcessLauncher] " << process_->program().toStdString()
                                << " finished, exit code " << exitCode
                                << (status == QProcess::CrashExit ? " (crashed)" : "");
        emit finished(exitCode);
    });
    connect(process_, &QProcess::errorOccurred, this, [this](QProcess::ProcessError) {
        emit errorOccurred(process_->errorString());
    });
    connect(process_, &QProcess::readyReadStandardOutput, this, [this]() {
        const QString text = QString::fromLocal8Bit(process_->readAllStandardOutput()).trimmed();
        if (!text.isEmpty())
            emit outputReceived(text);
    });
}

QProcessLauncher::~QProcessLauncher()
{
    if (process_->state() != QProcess::NotRunning) {
        disconnect(process_, nullptr, this, nullptr);
        process_->kill();
        process_->waitForFinished(1000);
    }
}

void QProcessLauncher::start(const QString& program, const QStringList& arguments)
{
    BOOST_LOG_TRIVIAL(info) << "[QProcessLauncher] Starting " << program.toStdString()
                            << " " << arguments.join(' ').toStdString();
    process_->start(program, arguments);
}

bool QProcessLauncher::waitForStarted(int timeoutMs)
{
    return process_->waitForStarted(timeoutMs);
}

bool QProcessLauncher::waitForFinished(int timeoutMs)
{
    if (process_->state() == QProcess::NotRunning)
        return true;
    return process_->waitForFinished(timeoutMs);
}

bool QProcessLauncher::isRunning() const
{
    return process_->state() != QProcess::NotRunning;
}

void QProcessLauncher::kill()
{
    if (process_->state() != QProcess::NotRunning)
        process_->kill();
}

} // namespace pyro
