#include "util/paths.hpp"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>
#include <stdexcept>

namespace util {

namespace {

boost::filesystem::path xdgDirectory (const char* variable, const char* fallback,
        const std::string& app) {
    const char* value = std::getenv(variable);
    /* Relative XDG values are invalid and ignored. */
    if (value && *value && boost::filesystem::path(value).is_absolute()) {
        return boost::filesystem::path(value) / app;
    }
    return homeDirectory() / fallback / app;
}

}

boost::filesystem::path homeDirectory () {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }

    struct passwd* entry = ::getpwuid(::getuid());
    if (entry && entry->pw_dir && *entry->pw_dir) {
        return entry->pw_dir;
    }

    throw std::runtime_error("Unable to determine the home directory");
}

boost::filesystem::path configDirectory (const std::string& app) {
    return xdgDirectory("XDG_CONFIG_HOME", ".config", app);
}

boost::filesystem::path dataDirectory (const std::string& app) {
    return xdgDirectory("XDG_DATA_HOME", ".local/share", app);
}

}
