#pragma once

#include "HookRegistry.hpp"
#include "HookTypes.hpp"
#include <QString>
#include <QThreadPool>
#include <atomic>
#include <functional>

namespace mine {

class AuditLog;

/// Runs the hooks registered for a command through the staged pipeline:
///   prevalidate -> preexec -> [command] -> postexec -> notify
///
/// Transform hooks run one after another on the calling thread, each
/// consuming the Context the previous one produced; the first failure
/// aborts the stage with a DispatchError. Notify hooks run concurrently on
/// a bounded background pool, are never awaited by the command, and only
/// ever log and audit their failures.
class Dispatcher {
public:
    using CommandBody = std::function<void(Context& ctx)>;

    /// Does NOT own registry or audit; both must outlive the dispatcher.
    /// audit may be null (notify failures are then only logged).
    /// At most maxConcurrentNotify notify hooks run at once. The rest queue,
    /// and a queued hook's timeout starts only when it gets a thread.
    explicit Dispatcher(HookRegistry& registry, AuditLog* audit = nullptr,
                        int maxConcurrentNotify = 4);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Run one stage for command. Notify stage returns ctx immediately.
    Context runStage(const QString& command, Stage stage, const Context& ctx);

    Context runTransformStage(const QString& command, Stage stage, const Context& ctx);
    void runNotifyStage(const QString& command, const Context& ctx);

    /// Full pipeline around body. When no hook matches command, body runs
    /// directly. Throws DispatchError ("hook <stage> failed: ...") on a
    /// transform failure; exceptions from body propagate unchanged.
    Context run(const QString& command, const Context& ctx, const CommandBody& body);

    /// Wait for in-flight notify hooks. Returns false if some are still
    /// running when timeoutMs expires (-1 waits indefinitely).
    bool drain(int timeoutMs = -1);

    int pendingNotifications() const { return pending_.load(); }

private:
    void reportNotifyFailure(const Hook& hook, const QString& command, const QString& error);

    HookRegistry& registry_;
    AuditLog* audit_;
    std::atomic<int> pending_{0};
    QThreadPool pool_;  // last member: joined first on destruction
};

} // namespace mine
