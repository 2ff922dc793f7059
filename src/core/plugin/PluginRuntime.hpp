#pragma once

#include <QMap>
#include <QString>
#include <QStringList>

namespace mine {

class HookRegistry;
class MineConfig;
class PluginStore;
struct InstalledPlugin;

/// Runs installed plugin binaries: as hooks, as custom commands and for
/// lifecycle notifications.
class PluginRuntime {
public:
    /// Register the hooks of every enabled, non-degraded plugin, named
    /// "<plugin>:<pattern>:<stage>" with source "plugin:<plugin>".
    /// Conflicting hooks are logged and skipped. With
    /// plugins.strict_protocol set, plugins built for another protocol
    /// major version are skipped. Returns the number of hooks registered.
    /// Throws RegistryError if the plugin registry cannot be read.
    static int registerPluginHooks(HookRegistry& registry, const PluginStore& store,
                                   const MineConfig& config);

    /// Run a plugin command with our terminal attached and no deadline.
    /// Returns the plugin's exit code. Throws HookError if it cannot start.
    static int runCommand(const InstalledPlugin& plugin, const QString& command,
                          const QStringList& args, const MineConfig& config,
                          const QMap<QString, QString>& flags = {});

    /// Tell a plugin it was installed or is about to be removed. Bounded by
    /// hooks.lifecycle_timeout_ms; failures are logged, never thrown.
    static void sendLifecycleEvent(const InstalledPlugin& plugin, const QString& event,
                                   const MineConfig& config);

    static QString binaryPath(const InstalledPlugin& plugin);
};

} // namespace mine
