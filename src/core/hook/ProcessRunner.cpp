#include "core/hook/ProcessRunner.hpp"
#include "core/hook/HookError.hpp"
#include <QDeadlineTimer>
#include <QFileInfo>
#include <QProcess>
#include <boost/log/trivial.hpp>
#include <limits>

namespace mine {

namespace {

int remainingMs(const QDeadlineTimer& deadline)
{
    if (deadline.isForever())
        return -1;
    return static_cast<int>(qMin<qint64>(deadline.remainingTime(), std::numeric_limits<int>::max()));
}

QString label(const QString& program)
{
    return QFileInfo(program).fileName();
}

} // namespace

ProcessResult ProcessRunner::run(const ProcessRequest& request)
{
    const bool bounded = request.timeout.count() > 0;
    QDeadlineTimer deadline = bounded
        ? QDeadlineTimer(static_cast<qint64>(request.timeout.count()))
        : QDeadlineTimer(QDeadlineTimer::Forever);

    QProcess proc;
    proc.setProgram(request.program);
    proc.setArguments(request.arguments);
    proc.setProcessEnvironment(request.environment);
    if (request.forwardOutput)
        proc.setProcessChannelMode(QProcess::ForwardedChannels);

    proc.start();
    if (!proc.waitForStarted(remainingMs(deadline))) {
        if (bounded && deadline.hasExpired() && proc.error() != QProcess::FailedToStart) {
            throw HookError(HookError::Kind::Timeout,
                            QStringLiteral("%1 timed out after %2ms")
                                .arg(label(request.program))
                                .arg(request.timeout.count()));
        }
        throw HookError(HookError::Kind::ProcessFailed,
                        QStringLiteral("failed to start %1: %2")
                            .arg(request.program, proc.errorString()));
    }

    if (!request.input.isEmpty())
        proc.write(request.input);
    proc.closeWriteChannel();

    if (!proc.waitForFinished(remainingMs(deadline)) && proc.state() != QProcess::NotRunning) {
        proc.kill();
        proc.waitForFinished(1000);
        BOOST_LOG_TRIVIAL(debug) << "ProcessRunner: killed " << request.program.toStdString()
                                 << " after " << request.timeout.count() << "ms";
        throw HookError(HookError::Kind::Timeout,
                        QStringLiteral("%1 timed out after %2ms")
                            .arg(label(request.program))
                            .arg(request.timeout.count()),
                        QString::fromUtf8(proc.readAllStandardError()));
    }

    ProcessResult result;
    if (!request.forwardOutput) {
        result.standardOutput = proc.readAllStandardOutput();
        result.standardError = proc.readAllStandardError();
    }
    result.exitCode = proc.exitCode();

    if (proc.exitStatus() == QProcess::CrashExit) {
        throw HookError(HookError::Kind::ProcessFailed,
                        QStringLiteral("%1 crashed").arg(label(request.program)),
                        QString::fromUtf8(result.standardError));
    }
    if (request.failOnNonZeroExit && result.exitCode != 0) {
        throw HookError(HookError::Kind::ProcessFailed,
                        QStringLiteral("%1 exited with status %2")
                            .arg(label(request.program))
                            .arg(result.exitCode),
                        QString::fromUtf8(result.standardError));
    }
    return result;
}

} // namespace mine
