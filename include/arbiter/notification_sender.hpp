#ifndef ARBITER_NOTIFICATION_SENDER_HPP
#define ARBITER_NOTIFICATION_SENDER_HPP

#include "arbiter/common.hpp"
#include "arbiter/message.hpp"
#include "arbiter/process_scanner.hpp"

#include <chrono>
#include <ostream>
#include <string>

namespace arbiter {

enum DeliveryStatus {
    DELIVERED,
    /* There was no sibling, or nowhere known to reach it. */
    NO_TARGET,
    /* The sibling never signalled it was accepting input. */
    NOT_READY,
    /* Anything else: oversized payload, vanished queue, full queue. */
    FAILED
};

const char* toString (DeliveryStatus status);
std::ostream& operator<< (std::ostream& os, DeliveryStatus status);

/* Fire-and-forget delivery of a message to another instance's channel.
 *
 * send() first waits, up to the timeout given at construction, for the
 * sibling's channel to take its readiness lock, then puts the message on the
 * sibling's queue. It never throws. The status it returns is for logging;
 * there is no acknowledgment from the other side, so DELIVERED only means the
 * message was queued. */
class NotificationSender {
public:
    explicit NotificationSender (std::chrono::milliseconds timeout =
            std::chrono::seconds(ARBITER_DELIVERY_TIMEOUT_SECONDS));

    DeliveryStatus send (const SiblingRef& sibling, MessageKind kind,
            const std::string& payload) const;

private:
    bool waitForReceiver (const std::string& address,
            std::chrono::steady_clock::time_point stopTime) const;

    std::chrono::milliseconds mTimeout;
};

}

#endif
