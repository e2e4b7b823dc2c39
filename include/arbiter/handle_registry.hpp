#ifndef ARBITER_HANDLE_REGISTRY_HPP
#define ARBITER_HANDLE_REGISTRY_HPP

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include <string>

namespace arbiter {

/* Per-user record of where the running instance can be reached. One slot per
 * owner, stored as an INI file in the user's configuration directory so that
 * every session of that user sees the same value.
 *
 * There is no locking, no expiry and no cleanup: set() simply overwrites, and
 * an address read back with get() may belong to a process that has since
 * exited. Treat it as a hint. */
class HandleRegistry {
public:
    explicit HandleRegistry (boost::filesystem::path directory);

    /* Record channelAddress for owner, replacing whatever was there. Throws
     * StorageError if the store cannot be written. */
    void set (const std::string& owner, const std::string& channelAddress);

    /* The address last recorded for owner, if any. A missing or unreadable
     * store reads as empty. */
    boost::optional<std::string> get (const std::string& owner) const;

    boost::filesystem::path storePath () const;

private:
    boost::filesystem::path mDirectory;
};

}

#endif
