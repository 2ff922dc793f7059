#pragma once

#include "HookTypes.hpp"
#include <QList>
#include <QString>
#include <chrono>

namespace mine {

class HookRegistry;

/// A hook script found in the user hooks directory.
struct UserHook {
    QString path;
    QString pattern;
    Stage stage = Stage::Preexec;
    QString name;   // file name, used as the hook name

    Mode mode() const { return defaultModeFor(stage); }
};

/// Scans the user hooks directory for scripts named
/// <command-pattern>.<stage>[.<ext>], e.g. "todo.add.preexec.sh",
/// "todo.*.notify.py", "*.postexec.sh".
/// Pure file scanning and name parsing, nothing is executed.
class HookDiscovery {
public:
    /// Parse right to left: optional extension, then stage, then pattern
    /// (which may itself contain dots). Throws HookDiscoveryError.
    static UserHook parseHookFilename(const QString& fileName);

    /// Executable regular files in hooksDir whose names parse, sorted by
    /// name. Files that do not qualify are skipped individually; a missing
    /// directory yields an empty list.
    static QList<UserHook> discover(const QString& hooksDir);

    /// Register every discovered script as a ScriptHookHandler. Conflicts are
    /// logged and skipped. Returns the number of hooks registered.
    static int registerUserHooks(HookRegistry& registry, const QString& hooksDir,
                                 std::chrono::milliseconds transformTimeout,
                                 std::chrono::milliseconds notifyTimeout);

    /// Write an executable starter script for pattern/stage into hooksDir.
    /// Rejects patterns with path separators or "..", and never overwrites.
    /// Returns the new file's path. Throws HookDiscoveryError.
    static QString createHookScript(const QString& hooksDir, const QString& pattern, Stage stage);

    /// Dry-run a hook script against a sample Context. Returns the
    /// resulting Context JSON for transform hooks, a status line for notify
    /// hooks. Throws HookDiscoveryError or HookError.
    static QString testHook(const QString& scriptPath);
};

} // namespace mine
