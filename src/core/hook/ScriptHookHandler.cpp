#include "ScriptHookHandler.hpp"
#include "HookProtocol.hpp"
#include "ProcessRunner.hpp"

namespace mine {

ScriptHookHandler::ScriptHookHandler(const QString& scriptPath, Mode mode)
    : scriptPath_(scriptPath), mode_(mode)
{
}

Context ScriptHookHandler::invoke(const Context& ctx, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
        timeout = mode_ == Mode::Transform ? kDefaultTransformTimeout : kDefaultNotifyTimeout;

    ProcessRequest req;
    req.program = scriptPath_;
    req.input = ctx.toJsonBytes();
    req.environment = QProcessEnvironment::systemEnvironment();
    req.timeout = timeout;

    ProcessResult result = ProcessRunner::run(req);

    if (mode_ == Mode::Notify)
        return ctx;

    return readTransformOutput(result.standardOutput, ctx,
                               QString::fromUtf8(result.standardError), true);
}

} // namespace mine
