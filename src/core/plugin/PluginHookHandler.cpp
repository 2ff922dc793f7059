#include "PluginHookHandler.hpp"
#include "core/hook/HookProtocol.hpp"
#include "core/hook/ProcessRunner.hpp"

namespace mine {

PluginHookHandler::PluginHookHandler(const QString& binaryPath, Stage stage, Mode mode,
                                     const QProcessEnvironment& environment)
    : binaryPath_(binaryPath), stage_(stage), mode_(mode), environment_(environment)
{
}

Context PluginHookHandler::invoke(const Context& ctx, std::chrono::milliseconds timeout)
{
    if (timeout.count() <= 0)
        timeout = mode_ == Mode::Transform ? kDefaultTransformTimeout : kDefaultNotifyTimeout;

    ProcessRequest req;
    req.program = binaryPath_;
    req.input = Invocation::forHook(stage_, mode_, ctx).serialize();
    req.environment = environment_;
    req.timeout = timeout;

    ProcessResult result = ProcessRunner::run(req);

    if (mode_ == Mode::Notify)
        return ctx;

    return readTransformOutput(result.standardOutput, ctx,
                               QString::fromUtf8(result.standardError), false);
}

} // namespace mine
