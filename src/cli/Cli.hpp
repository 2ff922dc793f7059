#pragma once

#include "core/MineConfig.hpp"
#include "core/plugin/AuditLog.hpp"
#include "core/plugin/PluginStore.hpp"
#include <QMap>
#include <QString>
#include <QStringList>
#include <QTextStream>

namespace mine::cli {

/// The `mine hook ...`, `mine plugin ...` and `mine dispatch ...` verbs.
/// Each returns the process exit code; engine exceptions propagate to main.
class Cli {
public:
    explicit Cli(const MineConfig& config);

    int hookList();
    int hookCreate(const QString& pattern, const QString& stage);
    int hookTest(const QString& path);

    int pluginList();
    int pluginInfo(const QString& name);
    int pluginInstall(const QString& sourceDir, bool assumeYes);
    int pluginRemove(const QString& name);
    int pluginRun(const QString& name, const QString& command, const QStringList& args);

    /// Run the hook pipeline for command around an empty body and print the
    /// resulting Context.
    int dispatch(const QString& command, const QStringList& args,
                 const QMap<QString, QString>& flags);

private:
    bool confirm(const QString& question);
    void audit(const QString& plugin, const QString& action, const QString& detail);

    const MineConfig& config_;
    PluginStore store_;
    AuditLog audit_;
    QTextStream out_;
    QTextStream in_;
};

} // namespace mine::cli
