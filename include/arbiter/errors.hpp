#ifndef ARBITER_ERRORS_HPP
#define ARBITER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace arbiter {

/* Thrown when a notification channel's message queue cannot be created or
 * serviced. */
class QueueError : public std::runtime_error {
public:
    explicit QueueError (const std::string& msg) : std::runtime_error(msg) { }
};

/* Thrown when a lock file in the temporary directory cannot be created or
 * locked. Usually needs external intervention (permissions, stale files). */
class FileLockError : public std::runtime_error {
public:
    explicit FileLockError (const std::string& msg) : std::runtime_error(msg) { }
};

/* Malformed command line or configuration file. */
class OptionError : public std::runtime_error {
public:
    explicit OptionError (const std::string& msg) : std::runtime_error(msg) { }
};

/* The per-user handle registry or the application data could not be read or
 * written. */
class StorageError : public std::runtime_error {
public:
    explicit StorageError (const std::string& msg) : std::runtime_error(msg) { }
};

/* /proc could not describe the calling process. */
class ScanError : public std::runtime_error {
public:
    explicit ScanError (const std::string& msg) : std::runtime_error(msg) { }
};

/* Result of an operation whose failure the caller reports and then carries
 * on from, e.g. importing a file on behalf of another instance. */
class Status {
public:
    static Status success () {
        return Status(true, std::string());
    }

    static Status failure (std::string msg) {
        return Status(false, std::move(msg));
    }

    bool ok () const {
        return mOk;
    }

    const std::string& message () const {
        return mMsg;
    }

private:
    Status (bool ok, std::string msg) : mOk(ok), mMsg(std::move(msg)) { }

    bool mOk;
    std::string mMsg;
};

}

#endif
