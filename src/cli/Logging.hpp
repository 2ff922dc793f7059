#pragma once

#include <QString>

namespace mine::cli {

/// Set the Boost.Log severity filter. level is one of trace, debug, info,
/// warning, error, fatal; anything else falls back to warning.
void initLogging(const QString& level);

} // namespace mine::cli
