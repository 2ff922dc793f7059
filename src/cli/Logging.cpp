#include "cli/Logging.hpp"
#include <QDebug>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace mine::cli {

void initLogging(const QString& level)
{
    namespace logging = boost::log;

    const std::string name = level.trimmed().toLower().toStdString();
    auto severity = logging::trivial::warning;
    if (!name.empty() && !logging::trivial::from_string(name.c_str(), name.size(), severity)) {
        qWarning() << "Unknown log level" << level << "- using warning";
        severity = logging::trivial::warning;
    }

    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

} // namespace mine::cli
