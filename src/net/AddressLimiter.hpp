#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

// Counts live connections per remote address. A slot is held for as long as its reservation lives; the limiter must
// outlive every reservation it hands out.
class AddressLimiter {
    class SlotObj {
        AddressLimiter &limiter_;
        std::string address_;
        friend AddressLimiter;
        SlotObj(AddressLimiter &limiter, std::string address) : limiter_(limiter), address_(std::move(address)) {}

    public:
        ~SlotObj() { limiter_.release(address_); }
        SlotObj(const SlotObj &) = delete;
        SlotObj(SlotObj &&) = delete;
        SlotObj &operator=(const SlotObj &) = delete;
        SlotObj &operator=(SlotObj &&) = delete;

        [[nodiscard]] const std::string &address() const noexcept { return address_; }
    };

public:
    using Slot = std::shared_ptr<SlotObj>;

private:
    size_t max_per_address_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> in_use_;

    void release(const std::string &address);

public:
    explicit AddressLimiter(size_t max_per_address) : max_per_address_(max_per_address) {}

    // Returns an empty slot if the address is already at its limit.
    [[nodiscard]] Slot try_reserve(const std::string &address);
    [[nodiscard]] size_t in_use(const std::string &address) const;
    [[nodiscard]] size_t max_per_address() const noexcept { return max_per_address_; }
};
