#pragma once

#include <QString>
#include <QVariant>
#include <yaml-cpp/yaml.h>

namespace mine {

/// Runtime configuration for the hook and plugin engine.
/// Backed by a single YAML tree: built-in defaults deep-merged with
/// <config dir>/config.yaml when present.
class MineConfig {
public:
    MineConfig();

    /// Merge a YAML file over the defaults. Throws YAML::Exception on
    /// unreadable or malformed input; defaults stay in effect in that case.
    void load(const QString& filePath);
    /// Write the merged tree. Throws std::runtime_error if the file cannot be written.
    void save(const QString& filePath) const;

    // Paths: empty config values resolve to the XDG defaults
    QString configDir() const;
    void setConfigDir(const QString& v);
    QString dataDir() const;
    void setDataDir(const QString& v);

    QString pluginsDir() const;
    QString registryFile() const;
    QString hooksDir() const;
    QString auditLogFile() const;
    QString configFile() const;

    // Hooks
    int transformTimeoutMs() const;
    void setTransformTimeoutMs(int v);
    int notifyTimeoutMs() const;
    void setNotifyTimeoutMs(int v);
    int lifecycleTimeoutMs() const;
    int notifyMaxConcurrent() const;
    int drainTimeoutMs() const;

    // Plugins
    bool strictProtocol() const;
    void setStrictProtocol(bool v);

    // Logging
    QString logLevel() const;

    // Generic dot-path access (e.g. "hooks.notify_timeout_ms")
    QVariant valueByPath(const QString& dottedKey) const;

private:
    YAML::Node root_;

    void initDefaults();
};

} // namespace mine
