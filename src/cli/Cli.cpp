#include "cli/Cli.hpp"
#include "core/hook/Dispatcher.hpp"
#include "core/hook/HookDiscovery.hpp"
#include "core/hook/HookError.hpp"
#include "core/hook/HookRegistry.hpp"
#include "core/plugin/Permissions.hpp"
#include "core/plugin/PluginErrors.hpp"
#include "core/plugin/PluginRuntime.hpp"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <algorithm>
#include <cstdio>

namespace mine::cli {

Cli::Cli(const MineConfig& config)
    : config_(config)
    , store_(config.pluginsDir(), config.registryFile())
    , audit_(config.auditLogFile())
    , out_(stdout, QIODevice::WriteOnly)
    , in_(stdin, QIODevice::ReadOnly)
{
}

bool Cli::confirm(const QString& question)
{
    out_ << "  " << question << " [y/N] " << Qt::flush;
    const QString answer = in_.readLine().trimmed().toLower();
    return answer == QLatin1String("y") || answer == QLatin1String("yes");
}

void Cli::audit(const QString& plugin, const QString& action, const QString& detail)
{
    try {
        audit_.append(plugin, action, detail);
    } catch (const AuditError& e) {
        qWarning() << "Audit log:" << e.what();
    }
}

// --- hook ---

int Cli::hookList()
{
    const QString dir = config_.hooksDir();
    const auto hooks = HookDiscovery::discover(dir);

    if (hooks.isEmpty()) {
        out_ << "\n  No hooks found.\n\n"
             << "  Hooks directory: " << dir << "\n"
             << "  Create one: mine hook create todo.add preexec\n\n";
        return 0;
    }

    out_ << "\n  User Hooks\n\n";
    for (const auto& h : hooks) {
        out_ << "  " << h.pattern.leftJustified(20) << " " << stageName(h.stage).leftJustified(12)
             << " " << modeName(h.mode()).leftJustified(10) << " " << h.name << "\n";
    }
    out_ << "\n  " << hooks.size() << " hooks in " << dir << "\n\n";
    return 0;
}

int Cli::hookCreate(const QString& pattern, const QString& stageText)
{
    const auto stage = parseStage(stageText);
    if (!stage) {
        qWarning().noquote() << QStringLiteral("invalid stage \"%1\" (valid: prevalidate, preexec, postexec, notify)")
                                    .arg(stageText);
        return 1;
    }

    const QString path = HookDiscovery::createHookScript(config_.hooksDir(), pattern, *stage);

    out_ << "  Created hook: " << path << "\n\n"
         << "  Pattern: " << pattern << "\n"
         << "  Stage:   " << stageName(*stage) << "\n\n"
         << "  Edit:    $EDITOR " << path << "\n"
         << "  Test:    mine hook test " << path << "\n\n";
    return 0;
}

int Cli::hookTest(const QString& path)
{
    out_ << "\n  Testing: " << path << "\n\n" << Qt::flush;

    const QString output = HookDiscovery::testHook(path);

    out_ << "  Hook executed successfully\n";
    if (!output.isEmpty())
        out_ << "\n  Output:\n  " << output << "\n";
    out_ << "\n";
    return 0;
}

// --- plugin ---

int Cli::pluginList()
{
    const auto plugins = store_.list();

    if (plugins.isEmpty()) {
        out_ << "\n  No plugins installed.\n\n"
             << "  Install: mine plugin install <path>\n\n";
        return 0;
    }

    out_ << "\n  Installed Plugins\n\n";
    for (const auto& p : plugins) {
        out_ << "  " << (p.enabled ? "*" : "-") << " " << p.manifest.name.leftJustified(20)
             << " v" << p.manifest.version.leftJustified(10) << " ";
        if (p.degraded)
            out_ << "broken: " << p.error;
        else
            out_ << p.manifest.hooks.size() << " hooks, " << p.manifest.commands.size() << " commands";
        out_ << "\n";
    }
    out_ << "\n  " << plugins.size() << " plugins installed\n\n";
    return 0;
}

int Cli::pluginInfo(const QString& name)
{
    const InstalledPlugin p = store_.get(name);
    const PluginManifest& m = p.manifest;

    auto kv = [this](const char* key, const QString& value) {
        out_ << "  " << QString::fromLatin1(key).leftJustified(12) << " " << value << "\n";
    };

    out_ << "\n  " << m.name << "\n\n";
    kv("Version", m.version);
    if (p.degraded) {
        kv("Error", p.error);
    } else {
        kv("Author", m.author);
        kv("Description", m.description);
        if (!m.license.isEmpty())
            kv("License", m.license);
        if (!m.minMineVersion.isEmpty())
            kv("Requires", QStringLiteral("mine >= ") + m.minMineVersion);
        kv("Protocol", m.protocolVersion);
        kv("Entrypoint", m.entrypoint());
    }
    kv("Directory", p.dir);
    kv("Source", p.source);
    kv("Installed", p.installedAt);
    kv("Enabled", p.enabled ? QStringLiteral("true") : QStringLiteral("false"));

    if (!m.hooks.isEmpty()) {
        out_ << "\n  Hooks\n";
        for (const auto& h : m.hooks) {
            out_ << "    " << h.command << "  " << h.stage << "  " << h.mode;
            if (!h.timeout.isEmpty())
                out_ << "  (" << h.timeout << ")";
            out_ << "\n";
        }
    }

    if (!m.commands.isEmpty()) {
        out_ << "\n  Commands\n";
        for (const auto& c : m.commands) {
            out_ << "    mine plugin run " << m.name << " " << c.name;
            if (!c.args.isEmpty())
                out_ << " " << c.args;
            out_ << "  " << c.description << "\n";
        }
    }

    out_ << "\n  Permissions\n";
    for (const auto& line : permissionSummary(m.permissions))
        out_ << "    " << line << "\n";
    out_ << "\n";
    return 0;
}

int Cli::pluginInstall(const QString& sourceDir, bool assumeYes)
{
    const PluginManifest manifest =
        PluginManifest::fromFile(QDir(sourceDir).filePath(kManifestFileName));

    out_ << "\n  Installing " << manifest.name << " v" << manifest.version
         << " by " << manifest.author << "\n"
         << "  " << manifest.description << "\n\n"
         << "  Permissions:\n";
    for (const auto& line : permissionSummary(manifest.permissions))
        out_ << "    " << line << "\n";
    out_ << "\n";

    try {
        const InstalledPlugin existing = store_.get(manifest.name);
        out_ << "  Upgrading from v" << existing.manifest.version << "\n";
        if (!existing.degraded) {
            const QStringList escalation =
                permissionEscalation(existing.manifest.permissions, manifest.permissions);
            for (const auto& line : escalation)
                out_ << "    " << line << "\n";
        }
        out_ << "\n";
    } catch (const PluginNotFoundError&) {
        // fresh install
    }

    if (!assumeYes && !confirm(QStringLiteral("Install this plugin?"))) {
        out_ << "  Installation cancelled.\n";
        return 0;
    }

    const InstalledPlugin p = store_.install(sourceDir, QFileInfo(sourceDir).absoluteFilePath());
    audit(p.manifest.name, QStringLiteral("install"), QStringLiteral("version=") + p.manifest.version);
    PluginRuntime::sendLifecycleEvent(p, QStringLiteral("install"), config_);

    out_ << "\n  Installed " << p.manifest.name << " v" << p.manifest.version << "\n"
         << "  " << p.manifest.hooks.size() << " hooks registered, "
         << p.manifest.commands.size() << " commands available\n\n";
    return 0;
}

int Cli::pluginRemove(const QString& name)
{
    const InstalledPlugin p = store_.get(name);

    // Binary is gone after remove()
    if (!p.degraded)
        PluginRuntime::sendLifecycleEvent(p, QStringLiteral("remove"), config_);

    store_.remove(name);
    audit(name, QStringLiteral("remove"), QStringLiteral("version=") + p.manifest.version);

    out_ << "  Removed " << name << "\n\n";
    return 0;
}

int Cli::pluginRun(const QString& name, const QString& command, const QStringList& args)
{
    const InstalledPlugin p = store_.get(name);
    if (p.degraded) {
        qWarning().noquote() << QStringLiteral("plugin \"%1\" is broken: %2").arg(name, p.error);
        return 1;
    }
    if (!p.enabled) {
        qWarning().noquote() << QStringLiteral("plugin \"%1\" is disabled").arg(name);
        return 1;
    }

    const bool declared = std::any_of(p.manifest.commands.begin(), p.manifest.commands.end(),
                                      [&](const CommandDef& c) { return c.name == command; });
    if (!declared) {
        qWarning().noquote() << QStringLiteral("plugin \"%1\" has no command \"%2\"").arg(name, command);
        return 1;
    }

    out_ << Qt::flush;
    return PluginRuntime::runCommand(p, command, args, config_);
}

// --- dispatch ---

int Cli::dispatch(const QString& command, const QStringList& args,
                  const QMap<QString, QString>& flags)
{
    HookRegistry registry;
    HookDiscovery::registerUserHooks(registry, config_.hooksDir(),
                                     std::chrono::milliseconds(config_.transformTimeoutMs()),
                                     std::chrono::milliseconds(config_.notifyTimeoutMs()));
    PluginRuntime::registerPluginHooks(registry, store_, config_);

    Dispatcher dispatcher(registry, &audit_, config_.notifyMaxConcurrent());

    const Context result = dispatcher.run(command, Context::make(command, args, flags),
                                          [](Context& ctx) {
                                              ctx.result = QJsonObject{{QStringLiteral("status"),
                                                                        QStringLiteral("ok")}};
                                          });

    out_ << QString::fromUtf8(QJsonDocument(result.toJson()).toJson(QJsonDocument::Indented)) << Qt::flush;

    if (!dispatcher.drain(config_.drainTimeoutMs())) {
        qWarning() << "Notify hooks still running after" << config_.drainTimeoutMs() << "ms:"
                   << dispatcher.pendingNotifications();
    }
    return 0;
}

} // namespace mine::cli
