#include "arbiter/process_scanner.hpp"
#include "arbiter/handle_registry.hpp"

#include "util/log.hpp"

namespace arbiter {

const char* toString (Classification classification) {
    switch (classification) {
        case NONE:
            return "None";
        case OWNED_HERE_SAME_CONTEXT:
            return "OwnedHereSameContext";
        case OWNED_HERE_OTHER_CONTEXT:
            return "OwnedHereOtherContext";
        case FOREIGN_OCCUPANT:
            return "ForeignOccupant";
    }
    return "unknown";
}

std::ostream& operator<< (std::ostream& os, Classification classification) {
    return os << toString(classification);
}

SiblingRef classifySiblings (const ProcessIdentity& current,
        const std::vector<ProcessIdentity>& processes) {
    SiblingRef sibling;

    for (const auto& candidate : processes) {
        if (candidate.pid == current.pid ||
                candidate.executableName != current.executableName) {
            continue;
        }

        bool sameSession = candidate.session == current.session;

        if (candidate.owner == current.owner) {
            sibling.classification = sameSession ?
                OWNED_HERE_SAME_CONTEXT : OWNED_HERE_OTHER_CONTEXT;
            sibling.process = candidate;
            break;
        }

        /* Keep looking: one of our own instances further down the list takes
         * precedence over this one. */
        if (sameSession) {
            sibling.classification = FOREIGN_OCCUPANT;
            sibling.process = candidate;
        }
    }

    return sibling;
}

ProcessScanner::ProcessScanner (const ProcessTable& table, const HandleRegistry& registry)
        : mTable(table)
        , mRegistry(registry) {
}

SiblingRef ProcessScanner::classify (const ProcessIdentity& current) const {
    LOG(debug) << "Scanning for other instances of " << current;

    auto sibling = classifySiblings(current, mTable.list());

    if (sibling.process) {
        sibling.channelAddress = mRegistry.get(sibling.process->owner);
        LOG(info) << "Found " << sibling.classification << " instance "
                  << *sibling.process << ", channel "
                  << (sibling.channelAddress ? *sibling.channelAddress : "<unknown>");
    }
    else {
        LOG(debug) << "No other instance found";
    }

    return sibling;
}

}
