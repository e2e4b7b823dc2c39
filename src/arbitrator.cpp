#include "arbiter/arbitrator.hpp"
#include "arbiter/common.hpp"
#include "arbiter/handle_registry.hpp"
#include "arbiter/main_subsystem.hpp"
#include "arbiter/notification_channel.hpp"
#include "arbiter/notification_sender.hpp"
#include "arbiter/options.hpp"
#include "arbiter/user_interface.hpp"

#include "util/log.hpp"

#include <boost/filesystem/operations.hpp>

#include <stdexcept>

namespace arbiter {

const char* toString (Arbitrator::State state) {
    switch (state) {
        case Arbitrator::SCANNING:
            return "Scanning";
        case Arbitrator::DEFERRING:
            return "Deferring";
        case Arbitrator::BLOCKING:
            return "Blocking";
        case Arbitrator::PROCEEDING:
            return "Proceeding";
        case Arbitrator::TERMINAL:
            return "Terminal";
    }
    return "unknown";
}

const char* toString (Arbitrator::Outcome outcome) {
    switch (outcome) {
        case Arbitrator::DEFERRED:
            return "deferred";
        case Arbitrator::BLOCKED:
            return "blocked";
        case Arbitrator::DECLINED:
            return "declined";
        case Arbitrator::EXPORTED:
            return "exported";
        case Arbitrator::EXPORT_FAILED:
            return "export failed";
        case Arbitrator::FINISHED:
            return "finished";
    }
    return "unknown";
}

std::ostream& operator<< (std::ostream& os, Arbitrator::State state) {
    return os << toString(state);
}

std::ostream& operator<< (std::ostream& os, Arbitrator::Outcome outcome) {
    return os << toString(outcome);
}

Arbitrator::Arbitrator (Context& context)
        : mContext(context)
        , mState(SCANNING) {
    mContext.channel.on(IMPORT_REQUEST,
            [this] (const std::string& path) { importRequested(path); });
    mContext.channel.on(FOREGROUND_REQUEST,
            [this] (const std::string&) { foregroundRequested(); });
}

Arbitrator::Outcome Arbitrator::run () {
    if (mState != SCANNING) {
        throw std::logic_error("Arbitrator::run called twice");
    }

    auto sibling = mContext.scanner.classify(mContext.self);

    Outcome outcome;
    switch (sibling.classification) {
        case OWNED_HERE_SAME_CONTEXT:
            outcome = defer(sibling);
            break;
        case OWNED_HERE_OTHER_CONTEXT:
        case FOREIGN_OCCUPANT:
            outcome = block(sibling);
            break;
        case NONE:
        default:
            outcome = proceed();
            break;
    }

    enter(TERMINAL);
    LOG(info) << "Arbitration " << outcome;
    return outcome;
}

Arbitrator::Outcome Arbitrator::defer (const SiblingRef& sibling) {
    enter(DEFERRING);

    if (!mContext.options.importPath.empty()) {
        /* The running instance has its own working directory. */
        auto importPath = boost::filesystem::absolute(mContext.options.importPath).string();
        auto status = mContext.sender.send(sibling, IMPORT_REQUEST, importPath);
        LOG(info) << "Handing " << importPath << " to the running instance: " << status;
    }

    auto status = mContext.sender.send(sibling, FOREGROUND_REQUEST, "");
    LOG(info) << "Asking the running instance to come to the foreground: " << status;

    return DEFERRED;
}

Arbitrator::Outcome Arbitrator::block (const SiblingRef& sibling) {
    enter(BLOCKING);

    std::string message = sibling.classification == FOREIGN_OCCUPANT ?
        "An instance of " ARBITER_APP_NAME " started by another user is already running in this session." :
        "An instance of " ARBITER_APP_NAME " you started is already running in another session.";
    mContext.ui.tellUser(message, "Cannot start " ARBITER_APP_NAME, UserInterface::OK);

    return BLOCKED;
}

Arbitrator::Outcome Arbitrator::proceed () {
    enter(PROCEEDING);

    if (!mContext.mainSubsystem.initStorage()) {
        LOG(info) << "Storage initialization declined";
        return DECLINED;
    }

    /* Exporting is a one-shot job, so there is nothing to publish. */
    const auto& exportPath = mContext.options.exportPath;
    if (!exportPath.empty()) {
        auto status = mContext.mainSubsystem.exportTo(exportPath);
        if (!status.ok()) {
            reportError(mContext.ui, "Unable to export to " + exportPath + ": " + status.message());
            return EXPORT_FAILED;
        }
        LOG(info) << "Exported to " << exportPath;
        return EXPORTED;
    }

    mContext.registry.set(mContext.self.owner, mContext.channel.address());
    mContext.channel.start();

    if (!mContext.options.importPath.empty()) {
        importRequested(mContext.options.importPath);
    }

    mContext.mainSubsystem.run();
    mContext.channel.stop();
    return FINISHED;
}

void Arbitrator::importRequested (const std::string& path) {
    LOG(info) << "Received request to import " << path;
    auto status = mContext.mainSubsystem.importFrom(path);
    if (!status.ok()) {
        reportError(mContext.ui, "Unable to import " + path + ": " + status.message());
    }
}

void Arbitrator::foregroundRequested () {
    LOG(info) << "Received request to come to the foreground";
    mContext.mainSubsystem.bringToForeground();
}

void Arbitrator::enter (State state) {
    LOG(debug) << "Arbitrator " << mState << " -> " << state;
    mState = state;
}

}
