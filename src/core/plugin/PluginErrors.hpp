#pragma once

#include <QString>
#include <stdexcept>

namespace mine {

/// Invalid or unreadable plugin manifest. field() names the offending key,
/// e.g. "plugin.name" or "hooks[2].stage".
class ManifestError : public std::runtime_error {
public:
    ManifestError(const QString& field, const QString& message)
        : std::runtime_error(message.toStdString()), field_(field)
    {
    }

    const QString& field() const { return field_; }

private:
    QString field_;
};

/// Failure reading or writing the persisted plugin registry, or copying
/// plugin files during install/remove.
class RegistryError : public std::runtime_error {
public:
    explicit RegistryError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class PluginNotFoundError : public RegistryError {
public:
    explicit PluginNotFoundError(const QString& name)
        : RegistryError(QStringLiteral("plugin \"%1\" not found").arg(name)), name_(name)
    {
    }

    const QString& name() const { return name_; }

private:
    QString name_;
};

/// The audit trail could not be written.
class AuditError : public std::runtime_error {
public:
    explicit AuditError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

} // namespace mine
