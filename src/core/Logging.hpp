#pragma once

#include <QString>
#include <boost/log/trivial.hpp>

namespace pyro {

/// Parse a level name ("trace" ... "fatal"). Unknown names yield info.
boost::log::trivial::severity_level parseLogLevel(const QString& name);

/// Install the global Boost.Log severity filter.
void initLogging(const QString& levelName);

} // namespace pyro
