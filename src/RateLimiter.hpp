/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "common/Time.hpp"

#include <deque>

// Allows at most `max_per_second` events in any one second window.
class RateLimiter {
    int max_per_second_;
    std::deque<Time> recent_;

public:
    explicit RateLimiter(int max_per_second) : max_per_second_(max_per_second) {}

    // Records the event and returns true if it's within the limit. Refused events aren't counted.
    bool allow(Time now);
};
