#include "core/Logging.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace pyro {

boost::log::trivial::severity_level parseLogLevel(const QString& name)
{
    using boost::log::trivial::severity_level;

    const QString lower = name.trimmed().toLower();
    if (lower == "trace") return severity_level::trace;
    if (lower == "debug") return severity_level::debug;
    if (lower == "warning" || lower == "warn") return severity_level::warning;
    if (lower == "error") return severity_level::error;
    if (lower == "fatal") return severity_level::fatal;
    return severity_level::info;
}

void initLogging(const QString& levelName)
{
    const auto level = parseLogLevel(levelName);
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    BOOST_LOG_TRIVIAL(debug) << "Log level set to " << levelName.toStdString();
}

} // namespace pyro
