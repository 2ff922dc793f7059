#pragma once

#include "core/hook/HookTypes.hpp"
#include <QString>
#include <chrono>

namespace mine {

/// Executes one hook. Plugin-backed and script-backed hooks implement this
/// identically from the dispatcher's point of view.
class IHookHandler {
public:
    virtual ~IHookHandler() = default;

    /// Run the hook against ctx. Transform handlers return the replacement
    /// Context (ctx itself when the hook had nothing to change); notify
    /// handlers return ctx. Throws HookError on failure.
    /// Must be safe to call from a worker thread.
    virtual Context invoke(const Context& ctx, std::chrono::milliseconds timeout) = 0;

    /// Executable behind the hook, for listings and diagnostics.
    virtual QString target() const = 0;
};

} // namespace mine
