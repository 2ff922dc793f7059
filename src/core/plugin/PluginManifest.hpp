#pragma once

#include "Permissions.hpp"
#include <QList>
#include <QString>

namespace mine {

inline constexpr const char* kManifestFileName = "mine-plugin.toml";

struct HookDef {
    QString command;    // pattern, e.g. "todo.*"
    QString stage;      // "prevalidate", "preexec", "postexec", "notify"
    QString mode;       // "transform" or "notify"
    QString timeout;    // optional duration, e.g. "500ms", "2s"
};

struct CommandDef {
    QString name;
    QString description;
    QString args;       // usage hint
};

struct PluginManifest {
    QString name;
    QString version;
    QString description;
    QString author;
    QString license;
    QString minMineVersion;
    QString protocolVersion;
    QString entrypointOverride;

    QList<HookDef> hooks;
    QList<CommandDef> commands;
    Permissions permissions;

    QString dirPath;    // Absolute path to the directory holding the manifest

    /// Throws ManifestError naming the first offending field.
    void validate() const;

    /// Executable name inside the plugin directory.
    QString entrypoint() const;

    /// Parse and validate a mine-plugin.toml file. Throws ManifestError.
    static PluginManifest fromFile(const QString& filePath);

    static bool isValidPluginName(const QString& name);
};

} // namespace mine
