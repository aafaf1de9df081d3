/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "RateLimiter.hpp"

bool RateLimiter::allow(Time now) {
    while (!recent_.empty() && now - recent_.front() >= Seconds(1))
        recent_.pop_front();
    if (static_cast<int>(recent_.size()) >= max_per_second_)
        return false;
    recent_.push_back(now);
    return true;
}
