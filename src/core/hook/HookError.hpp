#pragma once

#include "core/hook/HookTypes.hpp"
#include <QString>
#include <stdexcept>

namespace mine {

/// Failure of a single hook subprocess call.
class HookError : public std::runtime_error {
public:
    enum class Kind {
        Timeout,        // deadline expired, process killed
        ProcessFailed,  // failed to start, crashed, or exited non-zero
        Malformed,      // transform output was not valid JSON
        Rejected        // hook answered with status "error"
    };

    HookError(Kind kind, const QString& message, const QString& stderrText = {},
              const QString& code = {})
        : std::runtime_error(compose(message, stderrText).toStdString())
        , kind_(kind), stderr_(stderrText), code_(code)
    {
    }

    Kind kind() const { return kind_; }
    const QString& stderrText() const { return stderr_; }

    /// Machine-readable code from an error Response, if any.
    const QString& code() const { return code_; }

    static QString kindName(Kind kind)
    {
        switch (kind) {
            case Kind::Timeout:       return QStringLiteral("timeout");
            case Kind::ProcessFailed: return QStringLiteral("process-failed");
            case Kind::Malformed:     return QStringLiteral("malformed-output");
            case Kind::Rejected:      return QStringLiteral("rejected");
        }
        return {};
    }

private:
    static QString compose(const QString& message, const QString& stderrText)
    {
        const QString trimmed = stderrText.trimmed();
        return trimmed.isEmpty() ? message : message + ": " + trimmed;
    }

    Kind kind_;
    QString stderr_;
    QString code_;
};

/// A transform hook failed; fatal to the in-flight command.
class DispatchError : public std::runtime_error {
public:
    DispatchError(const QString& message, const QString& hookName, Stage stage,
                  HookError::Kind kind)
        : std::runtime_error(message.toStdString())
        , hookName_(hookName), stage_(stage), kind_(kind)
    {
    }

    const QString& hookName() const { return hookName_; }
    Stage stage() const { return stage_; }
    HookError::Kind kind() const { return kind_; }

private:
    QString hookName_;
    Stage stage_;
    HookError::Kind kind_;
};

/// Hook rejected by HookRegistry::registerHook (missing fields or conflict).
class HookRegistrationError : public std::invalid_argument {
public:
    explicit HookRegistrationError(const QString& message)
        : std::invalid_argument(message.toStdString())
    {
    }
};

/// User hook filename does not follow <pattern>.<stage>.<ext>.
class HookDiscoveryError : public std::runtime_error {
public:
    explicit HookDiscoveryError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

} // namespace mine
