/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

class CommandRegistry;

void register_auth_commands(CommandRegistry &registry);
void register_character_commands(CommandRegistry &registry);
void register_movement_commands(CommandRegistry &registry);
void register_info_commands(CommandRegistry &registry);
void register_communication_commands(CommandRegistry &registry);

// Everything a player can type, in the order help lists it.
void register_default_commands(CommandRegistry &registry);
