/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Direction.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class Connection;
class Session;
struct Mud;

// Everything a command gets to work with for one line of input.
struct Context {
    Session &session;
    Connection &connection;
    Mud &mud;
    // Arguments after the verb, split on whitespace.
    std::vector<std::string> args;
    std::string raw_input;
    // The argument text exactly as typed (bar surrounding whitespace).
    std::string_view rest() const;
};

struct Command {
    virtual ~Command() = default;
    // The primary verb first, then any aliases.
    [[nodiscard]] virtual const std::vector<std::string> &names() const = 0;
    [[nodiscard]] virtual std::string_view help() const = 0;
    virtual void execute(Context &ctx) const = 0;
};

// A command implemented by a free function.
class SimpleCommand : public Command {
public:
    using Function = std::function<void(Context &)>;

private:
    std::vector<std::string> names_;
    std::string help_;
    Function function_;

public:
    SimpleCommand(std::vector<std::string> names, std::string help, Function function)
        : names_(std::move(names)), help_(std::move(help)), function_(std::move(function)) {}

    const std::vector<std::string> &names() const override { return names_; }
    std::string_view help() const override { return help_; }
    void execute(Context &ctx) const override { function_(ctx); }
};

// Walks the player one step in a fixed direction.
class MoveCommand : public Command {
    Direction direction_;
    std::vector<std::string> names_;
    std::string help_;

public:
    explicit MoveCommand(Direction direction);

    [[nodiscard]] Direction direction() const noexcept { return direction_; }
    const std::vector<std::string> &names() const override { return names_; }
    std::string_view help() const override { return help_; }
    void execute(Context &ctx) const override;
};
