#include "Dispatcher.hpp"
#include "HookError.hpp"
#include "core/plugin/AuditLog.hpp"
#include "core/plugin/PluginErrors.hpp"
#include <boost/log/trivial.hpp>

namespace mine {

namespace {

// "plugin:obsidian" -> "obsidian"; anything else is reported as-is
QString auditSubject(const QString& source)
{
    return source.startsWith(QLatin1String("plugin:")) ? source.mid(7) : source;
}

} // namespace

Dispatcher::Dispatcher(HookRegistry& registry, AuditLog* audit, int maxConcurrentNotify)
    : registry_(registry), audit_(audit)
{
    pool_.setMaxThreadCount(maxConcurrentNotify > 0 ? maxConcurrentNotify : 1);
}

Dispatcher::~Dispatcher()
{
    pool_.waitForDone();
}

Context Dispatcher::runStage(const QString& command, Stage stage, const Context& ctx)
{
    if (stage == Stage::Notify) {
        runNotifyStage(command, ctx);
        return ctx;
    }
    return runTransformStage(command, stage, ctx);
}

Context Dispatcher::runTransformStage(const QString& command, Stage stage, const Context& ctx)
{
    Context current = ctx;

    for (const auto& hook : registry_.resolve(command, stage)) {
        if (hook.mode != Mode::Transform)
            continue;

        try {
            current = hook.handler->invoke(current, hook.effectiveTimeout());
        } catch (const HookError& e) {
            BOOST_LOG_TRIVIAL(error) << "Hook " << hook.name.toStdString() << " ("
                                     << stageName(stage).toStdString() << ") failed ["
                                     << HookError::kindName(e.kind()).toStdString() << "]: " << e.what();
            throw DispatchError(QStringLiteral("hook \"%1\" (%2): %3")
                                    .arg(hook.name, stageName(stage), QString::fromStdString(e.what())),
                                hook.name, stage, e.kind());
        }
    }
    return current;
}

void Dispatcher::runNotifyStage(const QString& command, const Context& ctx)
{
    const auto hooks = registry_.resolve(command, Stage::Notify);

    for (const auto& hook : hooks) {
        ++pending_;
        pool_.start([this, hook, command, ctx]() {
            try {
                hook.handler->invoke(ctx, hook.effectiveTimeout());
            } catch (const HookError& e) {
                reportNotifyFailure(hook, command,
                                    HookError::kindName(e.kind()) + ": " + QString::fromStdString(e.what()));
            } catch (const std::exception& e) {
                reportNotifyFailure(hook, command, QString::fromStdString(e.what()));
            }
            --pending_;
        });
    }
}

void Dispatcher::reportNotifyFailure(const Hook& hook, const QString& command, const QString& error)
{
    BOOST_LOG_TRIVIAL(warning) << "Notify hook " << hook.name.toStdString() << " for "
                               << command.toStdString() << " failed: " << error.toStdString();
    if (!audit_)
        return;

    try {
        audit_->append(auditSubject(hook.source), QStringLiteral("notify-failed"),
                       QStringLiteral("hook=%1 command=%2 error=%3").arg(hook.name, command, error));
    } catch (const AuditError& e) {
        BOOST_LOG_TRIVIAL(error) << "Audit log unavailable: " << e.what();
    }
}

Context Dispatcher::run(const QString& command, const Context& ctx, const CommandBody& body)
{
    Context current = ctx;

    // Fast path: nothing registered for this command
    if (registry_.count() == 0 || !registry_.hasHooks(command)) {
        body(current);
        return current;
    }

    auto transform = [&](Stage stage) {
        try {
            current = runTransformStage(command, stage, current);
        } catch (const DispatchError& e) {
            throw DispatchError(QStringLiteral("hook %1 failed: %2")
                                    .arg(stageName(stage), QString::fromStdString(e.what())),
                                e.hookName(), e.stage(), e.kind());
        }
    };

    transform(Stage::Prevalidate);
    transform(Stage::Preexec);

    body(current);

    transform(Stage::Postexec);
    runNotifyStage(command, current);
    return current;
}

bool Dispatcher::drain(int timeoutMs)
{
    return pool_.waitForDone(timeoutMs);
}

} // namespace mine
