#ifndef ARBITER_TMP_FILE_LOCK_HPP
#define ARBITER_TMP_FILE_LOCK_HPP

#include "arbiter/errors.hpp"

#include <boost/interprocess/creation_tags.hpp>
#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/filesystem.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <fstream>
#include <string>

namespace arbiter {

/* An advisory lock on a file named name in the system temporary directory.
 * The lock is released by the kernel when the owning process exits, which is
 * what makes it usable as a liveness signal between processes.
 *
 * These are fcntl locks: two tmp_file_lock objects for the same name in the
 * same process do not exclude each other, and destroying either of them drops
 * every lock the process holds on that file. Keep one object per name per
 * process. */
class tmp_file_lock {
public:
    /* Create the lock file if it does not exist yet. Throws FileLockError if
     * the file cannot be created or opened. */
    explicit tmp_file_lock (const std::string& name)
            : mPath(pathFor(name)) {
        /* Touch the file. */
        std::ofstream(mPath.string().c_str(), std::ios::app).flush();
        open();
    }

    /* Open an existing lock file and never create one. Throws FileLockError
     * if the file is not there. */
    tmp_file_lock (const std::string& name, boost::interprocess::open_only_t)
            : mPath(pathFor(name)) {
        open();
    }

    static boost::filesystem::path pathFor (const std::string& name) {
        return boost::filesystem::temp_directory_path() / name;
    }

    static bool exists (const std::string& name) {
        boost::system::error_code ec;
        return boost::filesystem::exists(pathFor(name), ec);
    }

    const boost::filesystem::path& path () const {
        return mPath;
    }

    /* Delete the lock file. Only call this when the name is being retired. */
    void remove () {
        boost::system::error_code ec;
        boost::filesystem::remove(mPath, ec);
    }

    bool try_lock () {
        return mFlock.try_lock();
    }

    bool timed_lock (const boost::posix_time::ptime& abs_time) {
        return mFlock.timed_lock(abs_time);
    }

    void unlock () {
        mFlock.unlock();
    }

private:
    void open () {
        try {
            boost::interprocess::file_lock flock { mPath.string().c_str() };
            mFlock.swap(flock);
        }
        catch (boost::interprocess::interprocess_exception& exc) {
            throw FileLockError("Unable to open lock file " + mPath.string() +
                    ": " + exc.what());
        }
    }

    boost::filesystem::path mPath;
    boost::interprocess::file_lock mFlock;
};

}

#endif
