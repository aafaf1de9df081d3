/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Database.hpp"

#include <fmt/format.h>

#include <mutex>
#include <random>

std::string make_record_id() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};
    std::lock_guard lock(mutex);
    const auto high = engine();
    const auto low = engine();
    return fmt::format("{:016x}{:016x}", high, low);
}
