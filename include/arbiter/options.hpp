#ifndef ARBITER_OPTIONS_HPP
#define ARBITER_OPTIONS_HPP

#include <boost/filesystem/path.hpp>
#include <boost/log/trivial.hpp>
#include <boost/optional.hpp>

#include <chrono>
#include <string>

namespace arbiter {

/* Everything the command line and the configuration file decide. Built once
 * in main and handed to the arbitrator through its Context. */
struct Options {
    Options ();

    /* Export everything to this directory, then exit. */
    std::string exportPath;

    /* Credentials file to import, here or in the instance already running. */
    std::string importPath;

    /* Show this to the user and exit without doing anything else. */
    boost::optional<std::string> fatalMessage;

    bool help;

    boost::log::trivial::severity_level logLevel;
    std::string logFile;

    boost::filesystem::path configFile;
    boost::filesystem::path registryDir;
    boost::filesystem::path dataDir;

    std::chrono::milliseconds deliveryTimeout;
};

/* Parse argv, then the configuration file (-c, or arbiterd.conf in the
 * user's configuration directory if present). Values given on the command
 * line win over the file.
 *
 * Throws OptionError on unknown options, malformed values, empty export or
 * import paths, or an explicitly named configuration file that is missing. */
Options parseOptions (int argc, const char* const argv[]);

/* Usage text, ending in a newline. */
std::string usage ();

}

#endif
