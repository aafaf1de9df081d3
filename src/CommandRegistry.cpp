/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CommandRegistry.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

std::string_view Context::rest() const {
    auto text = trim(raw_input);
    // Single character shortcuts such as ' are the verb without any space after them.
    if (!text.empty() && (text.front() == '\'' || text.front() == ':'))
        return trim(text.substr(1));
    const auto verb_end = text.find_first_of(" \t");
    if (verb_end == std::string_view::npos)
        return {};
    return trim(text.substr(verb_end));
}

void CommandRegistry::add(std::shared_ptr<const Command> command) {
    if (!command || command->names().empty())
        throw std::invalid_argument("Commands need at least one name");
    std::vector<std::string> verbs;
    for (auto &name : command->names()) {
        auto verb = lower_case(name);
        if (verb.empty())
            throw std::invalid_argument("Command names may not be empty");
        if (by_verb_.count(verb) || std::find(verbs.begin(), verbs.end(), verb) != verbs.end())
            throw std::invalid_argument(fmt::format("Command '{}' is already registered", verb));
        verbs.push_back(std::move(verb));
    }
    for (auto &verb : verbs)
        by_verb_.emplace(std::move(verb), command);
    commands_.push_back(std::move(command));
}

const Command *CommandRegistry::get(std::string_view verb) const {
    if (auto it = by_verb_.find(lower_case(verb)); it != by_verb_.end())
        return it->second.get();
    return nullptr;
}
