#pragma once

#include "PluginManifest.hpp"
#include <QList>
#include <QString>

namespace mine {

/// One record in the persisted plugin registry (plugins.yaml).
struct PluginEntry {
    QString name;
    QString version;
    QString source;         // where it was installed from
    QString dir;
    QString installedAt;    // RFC3339, UTC
    bool enabled = true;
};

/// An installed plugin as seen at runtime. The manifest is re-read from
/// disk every time; a plugin whose manifest cannot be read is still
/// reported, with degraded set and only registry metadata filled in.
struct InstalledPlugin {
    PluginManifest manifest;
    QString dir;
    QString source;
    QString installedAt;
    bool enabled = true;

    bool degraded = false;
    QString error;
};

/// Installs, removes and enumerates plugins under a plugins root, keeping
/// the registry file in step. Every call reloads the registry from disk.
class PluginStore {
public:
    PluginStore(const QString& pluginsDir, const QString& registryFile);

    /// Install from a directory holding mine-plugin.toml. Reinstalling the
    /// same name replaces the previous entry. Throws ManifestError or
    /// RegistryError.
    InstalledPlugin install(const QString& sourceDir, const QString& source);

    /// Throws PluginNotFoundError (nothing changed) or RegistryError.
    void remove(const QString& name);

    QList<InstalledPlugin> list() const;

    /// Throws PluginNotFoundError.
    InstalledPlugin get(const QString& name) const;

    QList<PluginEntry> entries() const;

    const QString& pluginsDir() const { return pluginsDir_; }
    const QString& registryFile() const { return registryFile_; }

private:
    QList<PluginEntry> loadRegistry() const;
    void saveRegistry(const QList<PluginEntry>& entries) const;

    QString pluginsDir_;
    QString registryFile_;
};

} // namespace mine
