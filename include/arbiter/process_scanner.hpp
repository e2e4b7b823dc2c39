#ifndef ARBITER_PROCESS_SCANNER_HPP
#define ARBITER_PROCESS_SCANNER_HPP

#include "arbiter/process.hpp"

#include <boost/optional.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace arbiter {

class HandleRegistry;

/* How the caller relates to another running instance of itself. */
enum Classification {
    /* No conflicting instance. */
    NONE,
    /* An instance started by our owner is running in our session. */
    OWNED_HERE_SAME_CONTEXT,
    /* An instance started by our owner is running in another session. */
    OWNED_HERE_OTHER_CONTEXT,
    /* An instance started by someone else is running in our session. */
    FOREIGN_OCCUPANT
};

const char* toString (Classification classification);
std::ostream& operator<< (std::ostream& os, Classification classification);

/* The instance a scan settled on, if any, and where to reach it. */
struct SiblingRef {
    SiblingRef () : classification(NONE) { }

    Classification classification;
    boost::optional<ProcessIdentity> process;
    boost::optional<std::string> channelAddress;
};

/* Classify current against processes, taken in the order given. Instances
 * with another executable name, and current itself, are skipped.
 *
 * The first instance with the same owner wins and ends the scan. An instance
 * with another owner in the same session is remembered but the scan goes on,
 * so a later same-owner instance replaces it. When both kinds are running the
 * answer therefore depends on the order the host lists processes in. That is
 * inherent to scanning without an atomic claim, and is kept as is.
 *
 * The returned channelAddress is always empty. */
SiblingRef classifySiblings (const ProcessIdentity& current,
        const std::vector<ProcessIdentity>& processes);

class ProcessScanner {
public:
    ProcessScanner (const ProcessTable& table, const HandleRegistry& registry);

    /* Scan the process table, then look up the channel address recorded for
     * the sibling's owner. */
    SiblingRef classify (const ProcessIdentity& current) const;

private:
    const ProcessTable& mTable;
    const HandleRegistry& mRegistry;
};

}

#endif
