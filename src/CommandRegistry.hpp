/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Command.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Maps verbs (case insensitively) to commands.
class CommandRegistry {
    std::map<std::string, std::shared_ptr<const Command>> by_verb_;
    std::vector<std::shared_ptr<const Command>> commands_;

public:
    // Registers the command under each of its names. Throws std::invalid_argument if a name is empty or taken.
    void add(std::shared_ptr<const Command> command);
    // Exact, case insensitive match. nullptr if there's no such verb.
    [[nodiscard]] const Command *get(std::string_view verb) const;
    // In registration order.
    [[nodiscard]] const std::vector<std::shared_ptr<const Command>> &all() const noexcept { return commands_; }
    [[nodiscard]] size_t size() const noexcept { return commands_.size(); }
};
