#include "Permissions.hpp"
#include "core/MineConfig.hpp"

namespace mine {

QStringList permissionSummary(const Permissions& perms)
{
    QStringList lines;

    if (perms.network)
        lines << QStringLiteral("Network: outbound access");
    if (!perms.filesystem.isEmpty())
        lines << QStringLiteral("Filesystem: %1").arg(perms.filesystem.join(", "));
    if (perms.store)
        lines << QStringLiteral("Store: read/write mine database");
    if (perms.configRead)
        lines << QStringLiteral("Config: read mine configuration");
    if (perms.configWrite)
        lines << QStringLiteral("Config: write mine configuration");
    if (!perms.envVars.isEmpty())
        lines << QStringLiteral("Environment: %1").arg(perms.envVars.join(", "));

    if (lines.isEmpty())
        lines << QStringLiteral("No special permissions required");
    return lines;
}

QStringList permissionEscalation(const Permissions& current, const Permissions& proposed)
{
    QStringList escalations;

    if (!current.network && proposed.network)
        escalations << QStringLiteral("NEW: network access");
    if (!current.store && proposed.store)
        escalations << QStringLiteral("NEW: database access");
    if (!current.configWrite && proposed.configWrite)
        escalations << QStringLiteral("NEW: config write access");

    for (const auto& path : proposed.filesystem) {
        if (!current.filesystem.contains(path))
            escalations << QStringLiteral("NEW: filesystem access to %1").arg(path);
    }
    for (const auto& var : proposed.envVars) {
        if (!current.envVars.contains(var))
            escalations << QStringLiteral("NEW: environment variable %1").arg(var);
    }

    escalations.removeDuplicates();
    return escalations;
}

QProcessEnvironment buildPluginEnvironment(const Permissions& perms, const MineConfig& config)
{
    const QProcessEnvironment parent = QProcessEnvironment::systemEnvironment();

    QProcessEnvironment env;
    env.insert(QStringLiteral("PATH"), parent.value(QStringLiteral("PATH")));
    env.insert(QStringLiteral("HOME"), parent.value(QStringLiteral("HOME")));

    for (const auto& name : perms.envVars) {
        const QString value = parent.value(name);
        if (!value.isEmpty())
            env.insert(name, value);
    }

    if (perms.configRead) {
        env.insert(QStringLiteral("MINE_CONFIG_DIR"), config.configDir());
        env.insert(QStringLiteral("MINE_DATA_DIR"), config.dataDir());
    }
    return env;
}

} // namespace mine
