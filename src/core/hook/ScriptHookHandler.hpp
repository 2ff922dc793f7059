#pragma once

#include "IHookHandler.hpp"

namespace mine {

/// Runs a user-authored hook script from the hooks directory.
/// The script reads the bare Context JSON on stdin; a transform script
/// writes the (possibly modified) Context, or nothing, to stdout.
/// Scripts inherit the full parent environment: they are authored by the
/// user and declare no permissions.
class ScriptHookHandler : public IHookHandler {
public:
    ScriptHookHandler(const QString& scriptPath, Mode mode);

    Context invoke(const Context& ctx, std::chrono::milliseconds timeout) override;
    QString target() const override { return scriptPath_; }

private:
    QString scriptPath_;
    Mode mode_;
};

} // namespace mine
