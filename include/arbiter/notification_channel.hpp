#ifndef ARBITER_NOTIFICATION_CHANNEL_HPP
#define ARBITER_NOTIFICATION_CHANNEL_HPP

#include "arbiter/message.hpp"
#include "arbiter/process.hpp"
#include "arbiter/tmp_file_lock.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/interprocess/ipc/message_queue.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>

namespace arbiter {

/* Receiving end of the notifications other instances send us.
 *
 * The channel owns a named message queue; the queue's name is the channel's
 * address, which is what gets published in the handle registry. Creating the
 * channel prepares the queue but does not make it ready: a sender only
 * delivers once start() has taken the readiness lock, which the kernel drops
 * again if this process dies.
 *
 * A service thread takes messages off the queue, copies the payload out, and
 * posts the dispatch onto the io_context given at construction. Handlers
 * therefore run on whichever thread runs that io_context, one at a time, and
 * never on the service thread. Register handlers before calling start(). */
class NotificationChannel {
public:
    typedef std::function<void(const std::string& payload)> Handler;

    /* Throws QueueError if the queue cannot be created, FileLockError if the
     * readiness lock file cannot be. */
    NotificationChannel (std::string address, boost::asio::io_context& loop);

    ~NotificationChannel ();

    NotificationChannel (const NotificationChannel&) = delete;
    NotificationChannel& operator= (const NotificationChannel&) = delete;

    /* The address a channel created by process would use. */
    static std::string addressFor (const ProcessIdentity& process);

    const std::string& address () const {
        return mAddress;
    }

    /* Install handler for messages of the given kind, replacing any previous
     * one. Messages nobody handles are logged and dropped. */
    void on (MessageKind kind, Handler handler);

    /* Take the readiness lock and start servicing the queue. Waits out
     * senders polling the lock; throws FileLockError if another process keeps
     * holding it. */
    void start ();

    /* Stop servicing the queue and drop the readiness lock. Blocks for at
     * most one polling interval. Messages already posted to the io_context
     * are still dispatched if it runs again. */
    void stop ();

    bool live () const {
        return mReadyLock.owns();
    }

private:
    void serviceThread ();

    bool timedReceiveAndPost (std::chrono::milliseconds timeout);

    void dispatch (std::uint32_t kind, const std::string& payload) const;

    std::map<std::uint32_t, Handler> mHandlers;

    std::atomic<bool> mStopServiceThreadFlag = { false };
    std::thread mServiceThread;

    std::string mAddress;
    boost::asio::io_context& mLoop;
    std::unique_ptr<boost::interprocess::message_queue> mQueue;
    tmp_file_lock mReadyMutex;
    boost::interprocess::scoped_lock<tmp_file_lock> mReadyLock;
};

}

#endif
