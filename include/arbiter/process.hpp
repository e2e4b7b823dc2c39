#ifndef ARBITER_PROCESS_HPP
#define ARBITER_PROCESS_HPP

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include <sys/types.h>

#include <ostream>
#include <string>
#include <vector>

namespace arbiter {

/* Snapshot of a process taken while scanning. Owner and session are opaque
 * text: they are only ever compared for equality and used as registry keys. */
struct ProcessIdentity {
    pid_t pid;
    std::string executableName;
    std::string owner;
    std::string session;
};

std::ostream& operator<< (std::ostream& os, const ProcessIdentity& process);

/* Source of process snapshots. Exists so that classification can run against
 * a made-up list of processes. */
class ProcessTable {
public:
    virtual ~ProcessTable () { }

    /* The calling process. */
    virtual ProcessIdentity current () const = 0;

    /* Every process visible right now, in whatever order the host lists
     * them. */
    virtual std::vector<ProcessIdentity> list () const = 0;
};

/* Process table backed by procfs.
 *
 * executableName is the kernel's command name (/proc/<pid>/stat), since that
 * is readable for other users' processes where /proc/<pid>/exe is not. owner
 * is the real uid. session is the login session from /proc/<pid>/sessionid,
 * or the POSIX session id on kernels without login session tracking. */
class ProcProcessTable : public ProcessTable {
public:
    explicit ProcProcessTable (boost::filesystem::path root = "/proc");

    /* Throws ScanError if the calling process cannot be described. */
    ProcessIdentity current () const override;

    std::vector<ProcessIdentity> list () const override;

    /* Describe one process, or nothing if it vanished or is unreadable. */
    boost::optional<ProcessIdentity> read (pid_t pid) const;

private:
    boost::filesystem::path mRoot;
};

}

#endif
