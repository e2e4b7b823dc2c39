#include "arbiter/notification_channel.hpp"
#include "arbiter/common.hpp"
#include "arbiter/errors.hpp"

#include "util/deadline.hpp"
#include "util/log.hpp"

#include <boost/asio/post.hpp>
#include <boost/scope_exit.hpp>

#include <exception>
#include <utility>

namespace arbiter {

namespace {

/* How often the service thread checks whether it has been told to stop. */
const std::chrono::milliseconds kPollingTimeout { 100 };

/* Senders checking readiness hold the lock only for the length of a
 * try_lock/unlock pair. */
const std::chrono::seconds kReadyLockTimeout { 2 };

}

NotificationChannel::NotificationChannel (std::string address, boost::asio::io_context& loop)
        : mAddress(std::move(address))
        , mLoop(loop)
        , mReadyMutex(mAddress + ARBITER_READY_SUFFIX) {
    using namespace boost::interprocess;

    /* A queue by this name can only be left over from a dead process that
     * had our pid. */
    if (!message_queue::remove(mAddress.c_str())) {
        LOG(debug) << "No stale message queue " << mAddress << " to remove";
    }

    try {
        mQueue.reset(new message_queue(create_only, mAddress.c_str(),
                    ARBITER_QUEUE_DEPTH, sizeof(Message)));
    }
    catch (interprocess_exception& exc) {
        throw QueueError("Unable to create queue named " + mAddress + ": " + exc.what());
    }

    LOG(debug) << "NotificationChannel(" << mAddress << ") constructed";
}

NotificationChannel::~NotificationChannel () {
    stop();
    mQueue.reset();
    boost::interprocess::message_queue::remove(mAddress.c_str());
    mReadyMutex.remove();
}

std::string NotificationChannel::addressFor (const ProcessIdentity& process) {
    return std::string(ARBITER_APP_NAME) + "-" + process.owner + "-" +
        std::to_string(process.pid);
}

void NotificationChannel::on (MessageKind kind, Handler handler) {
    mHandlers[kind] = std::move(handler);
}

void NotificationChannel::start () {
    using namespace boost::interprocess;

    if (mServiceThread.joinable()) {
        return;
    }

    scoped_lock<tmp_file_lock> readyLock { mReadyMutex, util::deadlineAfter(kReadyLockTimeout) };
    if (!readyLock.owns()) {
        throw FileLockError("Readiness lock " + mReadyMutex.path().string() +
                " is held by another process");
    }
    mReadyLock.swap(readyLock);

    LOG(debug) << "NotificationChannel(" << mAddress << ") accepting messages";
    mServiceThread = std::thread([this] () { serviceThread(); });
}

void NotificationChannel::stop () {
    bool expected = false;
    if (mServiceThread.joinable() &&
            mStopServiceThreadFlag.compare_exchange_strong(expected, true)) {
        LOG(debug) << "NotificationChannel(" << mAddress << ") stopping service thread";
        mServiceThread.join();
        mStopServiceThreadFlag = false;
    }

    if (mReadyLock.owns()) {
        mReadyLock.unlock();
    }
}

/* XXX Anything in here that can block must keep checking
 * mStopServiceThreadFlag, or stop() will hang. */
void NotificationChannel::serviceThread () {
    BOOST_SCOPE_EXIT(void) {
        LOG(debug) << "Exiting notification channel service thread";
    } BOOST_SCOPE_EXIT_END

    LOG(debug) << "Notification channel service thread started";

    try {
        while (!mStopServiceThreadFlag) {
            timedReceiveAndPost(kPollingTimeout);
        }
    }
    catch (boost::interprocess::interprocess_exception& exc) {
        /* Nobody can catch this on our own thread. Hand it to whoever runs
         * the event loop, which is where the process-wide handler lives. */
        LOG(error) << "Notification channel " << mAddress << " failed: " << exc.what();
        auto error = std::make_exception_ptr(
                QueueError("Notification channel " + mAddress + " failed: " + exc.what()));
        boost::asio::post(mLoop, [error] () { std::rethrow_exception(error); });
    }
}

bool NotificationChannel::timedReceiveAndPost (std::chrono::milliseconds timeout) {
    Message message;

    /* Things we have to receive because we're using Boost.Interprocess
     * message_queues, but don't care about. */
    boost::interprocess::message_queue::size_type nReceivedBytes;
    unsigned int priority;

    if (!mQueue->timed_receive(&message, sizeof(message), nReceivedBytes, priority,
                util::deadlineAfter(timeout))) {
        return false;
    }

    if (nReceivedBytes != sizeof(message) || message.length > ARBITER_MAX_PAYLOAD) {
        LOG(warning) << "Discarding malformed message of " << nReceivedBytes
                     << " bytes on " << mAddress;
        return true;
    }

    /* message is reused by the next receive; the handler gets its own copy. */
    std::string payload (message.payload, message.length);
    std::uint32_t kind = message.kind;

    boost::asio::post(mLoop, [this, kind, payload] () { dispatch(kind, payload); });
    return true;
}

void NotificationChannel::dispatch (std::uint32_t kind, const std::string& payload) const {
    auto it = mHandlers.find(kind);
    if (it == mHandlers.end() || !it->second) {
        LOG(debug) << "Ignoring message with unknown id " << kind << " on " << mAddress;
        return;
    }

    LOG(debug) << "Dispatching " << static_cast<MessageKind>(kind) << " on " << mAddress;
    it->second(payload);
}

}
