#ifndef ARBITER_MESSAGE_HPP
#define ARBITER_MESSAGE_HPP

#include "arbiter/common.hpp"

#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>
#include <type_traits>

namespace arbiter {

/* Message identifiers are deliberately far from zero and from each other so
 * that a stray message landing on the wrong queue is not mistaken for one of
 * ours. */
enum MessageKind : std::uint32_t {
    IMPORT_REQUEST = 7775632,
    FOREGROUND_REQUEST = 7775633
};

inline const char* toString (MessageKind kind) {
    switch (kind) {
        case IMPORT_REQUEST:
            return "ImportRequest";
        case FOREGROUND_REQUEST:
            return "ForegroundRequest";
    }
    return "unknown";
}

inline std::ostream& operator<< (std::ostream& os, MessageKind kind) {
    return os << toString(kind);
}

/* What actually travels through a channel's queue. The queue copies raw
 * bytes, so this must stay a standard layout type with no pointers. The
 * payload is NUL-terminated for the benefit of anything reading it as a C
 * string, but length is authoritative. */
struct Message {
    std::uint32_t kind;
    std::uint32_t length;
    char payload[ARBITER_MAX_PAYLOAD + 1];
};

static_assert(std::is_standard_layout<Message>::value,
        "Message crosses process boundaries and must be standard layout");

/* Fill msg with kind and payload. Returns false, leaving msg untouched, if
 * the payload does not fit. */
inline bool encodeMessage (Message& msg, MessageKind kind, const std::string& payload) {
    if (payload.size() > ARBITER_MAX_PAYLOAD) {
        return false;
    }
    std::memset(&msg, 0, sizeof(msg));
    msg.kind = kind;
    msg.length = static_cast<std::uint32_t>(payload.size());
    std::memcpy(msg.payload, payload.data(), payload.size());
    msg.payload[payload.size()] = '\0';
    return true;
}

}

#endif
