/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "Password.hpp"

#include <crypt.h>
#include <fmt/format.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>

namespace {

constexpr std::string_view SaltChars = "./0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
constexpr auto SaltLength = 16u;

std::string random_salt() {
    static std::mutex mutex;
    static std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, SaltChars.size() - 1);
    std::lock_guard lock(mutex);
    std::string salt;
    for (auto i = 0u; i < SaltLength; ++i)
        salt.push_back(SaltChars[pick(engine)]);
    return salt;
}

// crypt_r signals failure with a null or a string starting with '*'.
std::optional<std::string> crypt_string(std::string_view password, const std::string &setting) {
    auto data = std::make_unique<crypt_data>();
    const std::string phrase(password);
    const char *result = ::crypt_r(phrase.c_str(), setting.c_str(), data.get());
    if (!result || *result == '*')
        return std::nullopt;
    return std::string(result);
}

}

std::string hash_password(std::string_view password) {
    if (auto hash = crypt_string(password, fmt::format("$6${}$", random_salt())))
        return *hash;
    throw std::runtime_error(fmt::format("Unable to hash password: {}", std::strerror(errno)));
}

bool check_password(std::string_view password, const std::string &stored_hash) {
    if (stored_hash.empty())
        return false;
    auto hash = crypt_string(password, stored_hash);
    return hash && *hash == stored_hash;
}
