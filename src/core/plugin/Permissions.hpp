#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace mine {

class MineConfig;

/// Capabilities a plugin declares in its manifest. Advisory only: shown
/// for confirmation and used to shape the subprocess environment, never
/// enforced by the OS.
struct Permissions {
    bool network = false;
    QStringList filesystem;
    bool store = false;
    bool configRead = false;
    bool configWrite = false;
    QStringList envVars;

    bool operator==(const Permissions& o) const
    {
        return network == o.network && filesystem == o.filesystem && store == o.store
            && configRead == o.configRead && configWrite == o.configWrite && envVars == o.envVars;
    }
};

/// Human-readable grant list shown at install time, in a fixed order.
QStringList permissionSummary(const Permissions& perms);

/// Capabilities in proposed that current does not grant ("NEW: ..." lines).
/// Empty when proposed adds nothing. Config read is not an escalation.
QStringList permissionEscalation(const Permissions& current, const Permissions& proposed);

/// Environment for a plugin subprocess, built from scratch: PATH and HOME,
/// declared variables that are set in our environment, and the mine
/// config/data directories when config_read is granted.
QProcessEnvironment buildPluginEnvironment(const Permissions& perms, const MineConfig& config);

} // namespace mine
