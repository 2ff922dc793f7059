#pragma once

#include <QByteArray>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <chrono>

namespace mine {

struct ProcessRequest {
    QString program;
    QStringList arguments;
    QByteArray input;                   // written to stdin, then stdin is closed
    QProcessEnvironment environment;
    std::chrono::milliseconds timeout{0}; // 0 = no deadline
    bool forwardOutput = false;         // stdout/stderr go to our terminal
    bool failOnNonZeroExit = true;
};

struct ProcessResult {
    QByteArray standardOutput;
    QByteArray standardError;
    int exitCode = 0;
};

/// Runs one subprocess to completion under a deadline.
/// Throws HookError: Kind::Timeout when the deadline expires (the child is
/// killed first), Kind::ProcessFailed when the program cannot be started,
/// crashes, or (with failOnNonZeroExit) exits non-zero. Captured stderr is
/// attached to the error. The child and its pipes never outlive the call.
class ProcessRunner {
public:
    static ProcessResult run(const ProcessRequest& request);
};

} // namespace mine
