/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include <magic_enum.hpp>

#include <string_view>

// Connected: no user yet. Authenticating: logging in or choosing a character. Playing: in the world with a character.
// Disconnected is terminal; such a session is no longer in the registry.
enum class SessionState { Connected, Authenticating, Playing, Disconnected };

[[nodiscard]] inline std::string_view to_string(SessionState state) { return magic_enum::enum_name(state); }

// Whether a session may move from one state to another. Staying in the same state is always allowed.
[[nodiscard]] constexpr bool is_valid_transition(SessionState from, SessionState to) noexcept {
    if (from == SessionState::Disconnected)
        return false;
    if (from == to || to == SessionState::Disconnected)
        return true;
    return (from == SessionState::Connected && to == SessionState::Authenticating)
           || (from == SessionState::Authenticating && to == SessionState::Playing);
}
