#pragma once

#include "IHookHandler.hpp"
#include "HookTypes.hpp"
#include <QList>
#include <QReadWriteLock>
#include <QString>
#include <chrono>
#include <memory>

namespace mine {

/// A registered interception point.
struct Hook {
    QString pattern;    // "todo.add", "todo.*", "*"
    Stage stage = Stage::Preexec;
    Mode mode = Mode::Transform;
    QString name;       // unique per pattern+stage; sort key for execution order
    QString source;     // "user" or "plugin:<name>"
    std::shared_ptr<IHookHandler> handler;
    std::chrono::milliseconds timeout{0};  // 0 = default for the mode

    std::chrono::milliseconds effectiveTimeout() const;
};

/// The set of dispatchable hooks for one process run.
/// Built by the bootstrap before any dispatch; reads and writes are guarded
/// by a read-write lock so late registration stays safe.
class HookRegistry {
public:
    HookRegistry() = default;
    HookRegistry(const HookRegistry&) = delete;
    HookRegistry& operator=(const HookRegistry&) = delete;

    /// Throws HookRegistrationError for a missing pattern, name or handler,
    /// a stage/mode mismatch, or an existing hook with the same
    /// pattern+stage+name.
    void registerHook(const Hook& hook);

    /// Drop every hook registered by source. Returns how many were removed.
    int unregisterSource(const QString& source);

    /// Hooks matching command at stage, ordered by name (then pattern, source).
    QList<Hook> resolve(const QString& command, Stage stage) const;

    bool hasHooks(const QString& command) const;
    QList<Hook> all() const;
    int count() const;

private:
    mutable QReadWriteLock lock_;
    QList<Hook> hooks_;
};

} // namespace mine
