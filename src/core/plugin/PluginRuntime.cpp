#include "PluginRuntime.hpp"
#include "Permissions.hpp"
#include "PluginHookHandler.hpp"
#include "PluginStore.hpp"
#include "core/MineConfig.hpp"
#include "core/hook/HookError.hpp"
#include "core/hook/HookProtocol.hpp"
#include "core/hook/HookRegistry.hpp"
#include "core/hook/ProcessRunner.hpp"
#include <QDir>
#include <boost/log/trivial.hpp>

namespace mine {

QString PluginRuntime::binaryPath(const InstalledPlugin& plugin)
{
    return QDir(plugin.dir).filePath(plugin.manifest.entrypoint());
}

int PluginRuntime::registerPluginHooks(HookRegistry& registry, const PluginStore& store,
                                       const MineConfig& config)
{
    const QString hostMajor = protocolMajor(QString::fromLatin1(MINE_PROTOCOL_VERSION));
    int registered = 0;

    for (const auto& p : store.list()) {
        const QString& name = p.manifest.name;

        if (!p.enabled)
            continue;
        if (p.degraded) {
            BOOST_LOG_TRIVIAL(warning) << "Skipping hooks of plugin " << name.toStdString()
                                       << ": " << p.error.toStdString();
            continue;
        }
        if (config.strictProtocol() && protocolMajor(p.manifest.protocolVersion) != hostMajor) {
            BOOST_LOG_TRIVIAL(warning) << "Plugin " << name.toStdString() << " speaks protocol "
                                       << p.manifest.protocolVersion.toStdString() << " (host is "
                                       << MINE_PROTOCOL_VERSION << "), skipping";
            continue;
        }

        const QString bin = binaryPath(p);
        const QProcessEnvironment env = buildPluginEnvironment(p.manifest.permissions, config);
        const QString source = QStringLiteral("plugin:") + name;

        for (const auto& def : p.manifest.hooks) {
            const auto stage = parseStage(def.stage);
            const auto mode = parseMode(def.mode);
            if (!stage || !mode) {
                BOOST_LOG_TRIVIAL(warning) << "Plugin " << name.toStdString() << ": bad hook "
                                           << def.command.toStdString() << " " << def.stage.toStdString();
                continue;
            }

            std::chrono::milliseconds timeout(*mode == Mode::Transform ? config.transformTimeoutMs()
                                                                       : config.notifyTimeoutMs());
            if (!def.timeout.isEmpty()) {
                if (auto parsed = parseDuration(def.timeout)) {
                    timeout = *parsed;
                } else {
                    BOOST_LOG_TRIVIAL(warning) << "Plugin " << name.toStdString() << ": invalid timeout \""
                                               << def.timeout.toStdString() << "\" for "
                                               << def.command.toStdString() << ", using "
                                               << timeout.count() << "ms";
                }
            }

            Hook hook;
            hook.pattern = def.command;
            hook.stage = *stage;
            hook.mode = *mode;
            hook.name = QStringLiteral("%1:%2:%3").arg(name, def.command, def.stage);
            hook.source = source;
            hook.handler = std::make_shared<PluginHookHandler>(bin, *stage, *mode, env);
            hook.timeout = timeout;

            try {
                registry.registerHook(hook);
                ++registered;
            } catch (const HookRegistrationError& e) {
                BOOST_LOG_TRIVIAL(warning) << "Plugin " << name.toStdString()
                                           << ": hook not registered: " << e.what();
            }
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Registered " << registered << " plugin hooks";
    return registered;
}

int PluginRuntime::runCommand(const InstalledPlugin& plugin, const QString& command,
                              const QStringList& args, const MineConfig& config,
                              const QMap<QString, QString>& flags)
{
    ProcessRequest req;
    req.program = binaryPath(plugin);
    req.input = Invocation::forCommand(command, args, flags).serialize();
    req.environment = buildPluginEnvironment(plugin.manifest.permissions, config);
    req.forwardOutput = true;
    req.failOnNonZeroExit = false;

    return ProcessRunner::run(req).exitCode;
}

void PluginRuntime::sendLifecycleEvent(const InstalledPlugin& plugin, const QString& event,
                                       const MineConfig& config)
{
    ProcessRequest req;
    req.program = binaryPath(plugin);
    req.input = Invocation::forLifecycle(event).serialize();
    req.environment = buildPluginEnvironment(plugin.manifest.permissions, config);
    req.timeout = std::chrono::milliseconds(config.lifecycleTimeoutMs());

    try {
        ProcessRunner::run(req);
    } catch (const HookError& e) {
        BOOST_LOG_TRIVIAL(warning) << "Lifecycle event " << event.toStdString() << " for plugin "
                                   << plugin.manifest.name.toStdString() << " failed: " << e.what();
    }
}

} // namespace mine
