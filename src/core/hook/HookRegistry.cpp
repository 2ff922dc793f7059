#include "HookRegistry.hpp"
#include "HookError.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace mine {

std::chrono::milliseconds Hook::effectiveTimeout() const
{
    if (timeout.count() > 0)
        return timeout;
    return mode == Mode::Transform ? kDefaultTransformTimeout : kDefaultNotifyTimeout;
}

void HookRegistry::registerHook(const Hook& hook)
{
    if (hook.pattern.isEmpty())
        throw HookRegistrationError(QStringLiteral("hook \"%1\": pattern is required").arg(hook.name));
    if (hook.name.isEmpty())
        throw HookRegistrationError(QStringLiteral("hook for \"%1\": name is required").arg(hook.pattern));
    if (!hook.handler)
        throw HookRegistrationError(QStringLiteral("hook \"%1\": handler is required").arg(hook.name));
    if ((hook.stage == Stage::Notify) != (hook.mode == Mode::Notify)) {
        throw HookRegistrationError(QStringLiteral("hook \"%1\": %2 mode is not valid at the %3 stage")
                                        .arg(hook.name, modeName(hook.mode), stageName(hook.stage)));
    }

    QWriteLocker locker(&lock_);
    for (const auto& existing : hooks_) {
        if (existing.pattern == hook.pattern && existing.stage == hook.stage
            && existing.name == hook.name) {
            throw HookRegistrationError(
                QStringLiteral("hook \"%1\" already registered for %2 at %3 (by %4)")
                    .arg(hook.name, hook.pattern, stageName(hook.stage), existing.source));
        }
    }
    hooks_.append(hook);

    BOOST_LOG_TRIVIAL(debug) << "HookRegistry: registered " << hook.name.toStdString()
                             << " (" << hook.pattern.toStdString() << ", "
                             << stageName(hook.stage).toStdString() << ", "
                             << hook.source.toStdString() << ")";
}

int HookRegistry::unregisterSource(const QString& source)
{
    QWriteLocker locker(&lock_);
    return static_cast<int>(hooks_.removeIf([&](const Hook& h) { return h.source == source; }));
}

QList<Hook> HookRegistry::resolve(const QString& command, Stage stage) const
{
    QList<Hook> matched;
    {
        QReadLocker locker(&lock_);
        for (const auto& h : hooks_) {
            if (h.stage == stage && matchPattern(h.pattern, command))
                matched.append(h);
        }
    }

    std::stable_sort(matched.begin(), matched.end(), [](const Hook& a, const Hook& b) {
        if (a.name != b.name) return a.name < b.name;
        if (a.pattern != b.pattern) return a.pattern < b.pattern;
        return a.source < b.source;
    });
    return matched;
}

bool HookRegistry::hasHooks(const QString& command) const
{
    QReadLocker locker(&lock_);
    return std::any_of(hooks_.cbegin(), hooks_.cend(), [&](const Hook& h) {
        return matchPattern(h.pattern, command);
    });
}

QList<Hook> HookRegistry::all() const
{
    QReadLocker locker(&lock_);
    return hooks_;
}

int HookRegistry::count() const
{
    QReadLocker locker(&lock_);
    return static_cast<int>(hooks_.size());
}

} // namespace mine
