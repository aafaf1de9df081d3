/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "CommandHelpers.hpp"
#include "CommandRegistry.hpp"
#include "Mud.hpp"
#include "Password.hpp"
#include "SessionRegistry.hpp"
#include "commands.hpp"
#include "common/Logger.hpp"
#include "net/Connection.hpp"

#include <fmt/format.h>

#include <memory>
#include <regex>

namespace {

const std::regex username_pattern("^[A-Za-z][A-Za-z0-9_]{2,19}$");
const std::regex email_pattern(R"(^[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}$)");
constexpr auto MinPasswordLength = 6u;

Logger &auth_log() {
    static Logger log = logger_for("Auth");
    return log;
}

void do_register(Context &ctx) {
    if (ctx.session.user_id()) {
        ctx.connection.send_line("You are already logged in.");
        return;
    }
    if (ctx.args.size() < 3) {
        ctx.connection.send_line("|YUsage: register <username> <password> <email>|p");
        return;
    }
    const auto &username = ctx.args[0];
    const auto &password = ctx.args[1];
    const auto &email = ctx.args[2];
    if (!std::regex_match(username, username_pattern)) {
        ctx.connection.send_line("|RInvalid username. Must be 3-20 characters, start with a letter, and contain only "
                                 "letters, numbers, and underscores.|p");
        return;
    }
    if (password.size() < MinPasswordLength) {
        ctx.connection.send_line(fmt::format("|RPassword must be at least {} characters long.|p", MinPasswordLength));
        return;
    }
    if (!std::regex_match(email, email_pattern)) {
        ctx.connection.send_line("|RInvalid email address.|p");
        return;
    }

    auto txn = ctx.mud.database().begin();
    if (txn->find_user_by_name(username)) {
        ctx.connection.send_line(fmt::format("|RUsername '{}' is already taken.|p", username));
        return;
    }
    if (txn->find_user_by_email(email)) {
        ctx.connection.send_line("|REmail address is already registered.|p");
        return;
    }
    UserRecord user{make_record_id(), username, email, hash_password(password), ctx.mud.current_time(),
                    ctx.mud.current_time()};
    txn->put_user(user);
    try {
        txn->commit();
    } catch (const DatabaseError &error) {
        auth_log().warn("Registration of {} failed: {}", username, error.what());
        ctx.connection.send_line("|RThat username or email address is already registered.|p");
        return;
    }
    auth_log().info("Session {}: registered user {}", ctx.session.id(), username);

    ctx.session.set_user(user.id);
    ctx.session.set_state(SessionState::Authenticating);
    ctx.connection.send_line(fmt::format("|GAccount created successfully! Welcome, {}!|p", username));
    ctx.connection.send_line("Type |Wcreate <name>|p to create your first character.");
}

void do_login(Context &ctx) {
    if (ctx.session.user_id()) {
        ctx.connection.send_line("You are already logged in.");
        return;
    }
    if (ctx.args.empty()) {
        ctx.connection.send_line("|YUsage: login <username> [password]|p");
        return;
    }
    ctx.session.set_state(SessionState::Authenticating);
    const auto &username = ctx.args[0];
    std::string password;
    if (ctx.args.size() >= 2) {
        password = ctx.args[1];
    } else {
        ctx.connection.send("Password: ");
        password = ctx.connection.read_password();
    }

    auto txn = ctx.mud.database().begin();
    auto user = txn->find_user_by_name(username);
    if (!user || !check_password(password, user->password_hash)) {
        auth_log().info("Session {}: failed login for {}", ctx.session.id(), username);
        ctx.connection.send_line("|RInvalid username or password.|p");
        return;
    }
    if (auto other = ctx.mud.sessions().get_session_by_user(user->id); other && other->id() != ctx.session.id()) {
        ctx.connection.send_line("|RThat account is already logged in elsewhere.|p");
        return;
    }

    const auto previous_login = user->last_login;
    user->last_login = ctx.mud.current_time();
    txn->put_user(*user);
    txn->commit();

    ctx.session.set_user(user->id);
    auth_log().info("Session {}: {} logged in", ctx.session.id(), user->username);
    ctx.connection.send_line(fmt::format("|GWelcome back, {}!|p", user->username));
    if (previous_login)
        ctx.connection.send_line(fmt::format("Last login: {}", formatted_time(*previous_login)));
    ctx.connection.send_line("Type |Wcharacters|p to list your characters, or |Wcreate <name>|p to make a new one.");
}

void do_logout(Context &ctx) {
    const auto user_id = ctx.session.user_id();
    if (!user_id) {
        ctx.connection.send_line("You are not logged in.");
        return;
    }
    std::string name;
    if (const auto character_id = ctx.session.character_id())
        name = character_name(ctx.mud, *character_id);
    else if (auto user = ctx.mud.database().begin()->find_user(*user_id))
        name = user->username;
    ctx.mud.leave_world(ctx.session);
    ctx.connection.send_line(fmt::format("Goodbye, {}!", name));
    ctx.mud.sessions().destroy_session(ctx.session.id());
}

void do_quit(Context &ctx) {
    ctx.mud.leave_world(ctx.session);
    ctx.connection.send_line("Farewell, traveler. May the roads rise to meet you.");
    ctx.mud.sessions().destroy_session(ctx.session.id());
    ctx.connection.close();
}

}

void register_auth_commands(CommandRegistry &registry) {
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"register"},
                                                 "register <username> <password> <email> - Create a new account",
                                                 do_register));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"login"},
                                                 "login <username> [password] - Log into your account", do_login));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"logout"},
                                                 "logout - Save and return to the login prompt", do_logout));
    registry.add(std::make_shared<SimpleCommand>(std::vector<std::string>{"quit", "exit"},
                                                 "quit - Save and disconnect", do_quit));
}
