#include "arbiter/notification_sender.hpp"
#include "arbiter/errors.hpp"
#include "arbiter/tmp_file_lock.hpp"

#include "util/deadline.hpp"
#include "util/log.hpp"

#include <boost/interprocess/ipc/message_queue.hpp>

#include <memory>
#include <thread>

namespace arbiter {

namespace {

const std::chrono::milliseconds kReadinessPollInterval { 10 };

}

const char* toString (DeliveryStatus status) {
    switch (status) {
        case DELIVERED:
            return "delivered";
        case NO_TARGET:
            return "no target";
        case NOT_READY:
            return "receiver not ready";
        case FAILED:
            return "failed";
    }
    return "unknown";
}

std::ostream& operator<< (std::ostream& os, DeliveryStatus status) {
    return os << toString(status);
}

NotificationSender::NotificationSender (std::chrono::milliseconds timeout)
        : mTimeout(timeout) {
}

DeliveryStatus NotificationSender::send (const SiblingRef& sibling, MessageKind kind,
        const std::string& payload) const {
    using namespace boost::interprocess;

    if (!sibling.process || !sibling.channelAddress) {
        LOG(debug) << "Not sending " << kind << ": no reachable sibling";
        return NO_TARGET;
    }

    const auto& address = *sibling.channelAddress;

    Message message;
    if (!encodeMessage(message, kind, payload)) {
        LOG(warning) << "Not sending " << kind << " to " << address << ": payload of "
                     << payload.size() << " bytes exceeds " << ARBITER_MAX_PAYLOAD;
        return FAILED;
    }

    try {
        auto stopTime = std::chrono::steady_clock::now() + mTimeout;
        if (!waitForReceiver(address, stopTime)) {
            LOG(debug) << "Timed out waiting for " << address << " to accept input";
            return NOT_READY;
        }

        message_queue queue { open_only, address.c_str() };
        if (!queue.timed_send(&message, sizeof(message), 0, util::deadlineAt(stopTime))) {
            LOG(debug) << "Queue " << address << " stayed full";
            return FAILED;
        }
    }
    catch (interprocess_exception& exc) {
        LOG(debug) << "Unable to send " << kind << " to " << address << ": " << exc.what();
        return FAILED;
    }

    LOG(debug) << "Sent " << kind << " to " << address;
    return DELIVERED;
}

/* A channel is ready while some other process holds its readiness lock. We
 * cannot block waiting for someone else to acquire a lock, so poll. The lock
 * file belongs to the channel: open it only once it shows up, never create
 * it, and keep it open for the rest of the wait. */
bool NotificationSender::waitForReceiver (const std::string& address,
        std::chrono::steady_clock::time_point stopTime) const {
    auto name = address + ARBITER_READY_SUFFIX;
    std::unique_ptr<tmp_file_lock> ready;

    LOG(debug) << "Waiting for " << address << " to accept input ...";

    while (true) {
        if (!ready && tmp_file_lock::exists(name)) {
            try {
                ready.reset(new tmp_file_lock(name, boost::interprocess::open_only));
            }
            catch (FileLockError& exc) {
                /* Removed again before we got to it. */
                LOG(debug) << exc.what();
            }
        }

        if (ready) {
            if (!ready->try_lock()) {
                return true;
            }
            ready->unlock();
        }

        if (std::chrono::steady_clock::now() >= stopTime) {
            return false;
        }
        std::this_thread::sleep_for(kReadinessPollInterval);
    }
}

}
