/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include <string>
#include <string_view>

// SHA-512 crypt hashes with a random salt: "$6$<salt>$<hash>". Throws std::runtime_error if the system can't hash.
[[nodiscard]] std::string hash_password(std::string_view password);
// Whether the password hashes to the stored value. A malformed stored hash never matches.
[[nodiscard]] bool check_password(std::string_view password, const std::string &stored_hash);
