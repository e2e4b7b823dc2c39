#ifndef UTIL_DEADLINE_HPP
#define UTIL_DEADLINE_HPP

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <chrono>

namespace util {

/* Boost.Interprocess takes absolute UTC deadlines as posix_time::ptime. */
template <typename Rep, typename Period>
boost::posix_time::ptime deadlineAfter (std::chrono::duration<Rep, Period> timeout) {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
    if (us < 0) {
        us = 0;
    }
    return boost::posix_time::microsec_clock::universal_time() +
        boost::posix_time::microseconds(static_cast<long long>(us));
}

/* Same thing for a deadline already expressed on the steady clock. */
inline boost::posix_time::ptime deadlineAt (std::chrono::steady_clock::time_point stopTime) {
    return deadlineAfter(stopTime - std::chrono::steady_clock::now());
}

}

#endif
