#ifndef UTIL_LOG_HPP
#define UTIL_LOG_HPP

#include <boost/log/trivial.hpp>

#include <string>

/* LOG(debug) << "..."; severities are those of boost::log::trivial: trace,
 * debug, info, warning, error, fatal. */
#define LOG(severity) BOOST_LOG_TRIVIAL(severity)

namespace util {

/* Drop records below level and write the rest to stderr, and to fileName as
 * well if it is not empty. Call once, early in main. */
void initLog (boost::log::trivial::severity_level level,
        const std::string& fileName = std::string());

}

#endif
