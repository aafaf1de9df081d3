#include "AddressLimiter.hpp"

void AddressLimiter::release(const std::string &address) {
    std::lock_guard lock(mutex_);
    if (auto it = in_use_.find(address); it != in_use_.end() && --it->second == 0)
        in_use_.erase(it);
}

AddressLimiter::Slot AddressLimiter::try_reserve(const std::string &address) {
    std::lock_guard lock(mutex_);
    auto &count = in_use_[address];
    if (count >= max_per_address_)
        return {};
    ++count;
    return Slot(new SlotObj(*this, address));
}

size_t AddressLimiter::in_use(const std::string &address) const {
    std::lock_guard lock(mutex_);
    if (auto it = in_use_.find(address); it != in_use_.end())
        return it->second;
    return 0;
}
