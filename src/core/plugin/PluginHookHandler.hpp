#pragma once

#include "core/hook/IHookHandler.hpp"
#include <QProcessEnvironment>

namespace mine {

/// Hook backed by an installed plugin binary. Each call sends an Invocation
/// envelope on stdin; transform hooks answer with a Response envelope.
class PluginHookHandler : public IHookHandler {
public:
    /// environment is the filtered set built from the plugin's permissions.
    PluginHookHandler(const QString& binaryPath, Stage stage, Mode mode,
                      const QProcessEnvironment& environment);

    Context invoke(const Context& ctx, std::chrono::milliseconds timeout) override;
    QString target() const override { return binaryPath_; }

private:
    QString binaryPath_;
    Stage stage_;
    Mode mode_;
    QProcessEnvironment environment_;
};

} // namespace mine
