#ifndef UTIL_PATHS_HPP
#define UTIL_PATHS_HPP

#include <boost/filesystem/path.hpp>

#include <string>

namespace util {

/* The invoking user's home directory: $HOME, else the password database.
 * Throws std::runtime_error if neither knows. */
boost::filesystem::path homeDirectory ();

/* $XDG_CONFIG_HOME/<app>, defaulting to ~/.config/<app>. */
boost::filesystem::path configDirectory (const std::string& app);

/* $XDG_DATA_HOME/<app>, defaulting to ~/.local/share/<app>. */
boost::filesystem::path dataDirectory (const std::string& app);

}

#endif
