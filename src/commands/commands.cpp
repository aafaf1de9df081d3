/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "commands.hpp"

void register_default_commands(CommandRegistry &registry) {
    register_auth_commands(registry);
    register_character_commands(registry);
    register_movement_commands(registry);
    register_info_commands(registry);
    register_communication_commands(registry);
}
