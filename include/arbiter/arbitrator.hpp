#ifndef ARBITER_ARBITRATOR_HPP
#define ARBITER_ARBITRATOR_HPP

#include "arbiter/process.hpp"
#include "arbiter/process_scanner.hpp"

#include <ostream>
#include <string>

namespace arbiter {

struct Options;
class HandleRegistry;
class MainSubsystem;
class NotificationChannel;
class NotificationSender;
class UserInterface;

/* Everything arbitration touches, built once in main. self is the snapshot
 * of the calling process the channel address was derived from. */
struct Context {
    const Options& options;
    ProcessIdentity self;
    const ProcessScanner& scanner;
    HandleRegistry& registry;
    const NotificationSender& sender;
    NotificationChannel& channel;
    MainSubsystem& mainSubsystem;
    UserInterface& ui;
};

/* Decides whether this instance runs, hands its work to an instance that is
 * already running, or refuses to start.
 *
 * Construction installs the channel's message handlers. run() scans once and
 * then does exactly one of:
 *
 *   - defer: an instance of ours runs in this session. Forward the import
 *     path, if any, ask it to come to the foreground, and finish.
 *   - block: an instance of ours runs in another session, or someone else's
 *     runs in this one. Tell the user and finish.
 *   - proceed: nobody else is running. Initialize storage; then either
 *     export and finish, or publish our channel, go live, import the import
 *     path locally and run the main subsystem until it returns.
 *
 * Every path ends in TERMINAL, and the caller is expected to exit. */
class Arbitrator {
public:
    enum State {
        SCANNING,
        DEFERRING,
        BLOCKING,
        PROCEEDING,
        TERMINAL
    };

    enum Outcome {
        DEFERRED,
        BLOCKED,
        DECLINED,
        EXPORTED,
        EXPORT_FAILED,
        FINISHED
    };

    explicit Arbitrator (Context& context);

    /* May only be called once. Throws std::logic_error otherwise. Exceptions
     * from the main subsystem's run loop propagate. */
    Outcome run ();

    State state () const {
        return mState;
    }

private:
    Outcome defer (const SiblingRef& sibling);
    Outcome block (const SiblingRef& sibling);
    Outcome proceed ();

    void importRequested (const std::string& path);
    void foregroundRequested ();

    void enter (State state);

    Context& mContext;
    State mState;
};

const char* toString (Arbitrator::State state);
const char* toString (Arbitrator::Outcome outcome);
std::ostream& operator<< (std::ostream& os, Arbitrator::State state);
std::ostream& operator<< (std::ostream& os, Arbitrator::Outcome outcome);

}

#endif
