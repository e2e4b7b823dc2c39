#ifndef ARBITER_COMMON_HPP
#define ARBITER_COMMON_HPP

/* Name of the application being arbitrated. Used for per-user directories,
 * channel addresses and user-visible text. */
#define ARBITER_APP_NAME "arbiterd"

/* A channel signals that it accepts input by holding an exclusive lock on
 * its address with this suffix appended. */
#define ARBITER_READY_SUFFIX ".ready"

/* Largest payload a message can carry, not counting the terminating NUL.
 * Payloads are file system paths, so this matches PATH_MAX - 1. */
#define ARBITER_MAX_PAYLOAD 4095

/* Number of messages a channel queue holds before senders block. */
#define ARBITER_QUEUE_DEPTH 16

/* How long a sender waits for a sibling to accept input. */
#define ARBITER_DELIVERY_TIMEOUT_SECONDS 10

#endif
