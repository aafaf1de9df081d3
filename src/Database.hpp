/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "common/Time.hpp"

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

class DatabaseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct UserRecord {
    std::string id;
    std::string username;
    std::string email;
    std::string password_hash;
    Time created_at{};
    std::optional<Time> last_login;
};

struct CharacterRecord {
    std::string id;
    std::string user_id;
    std::string name;
    std::string room_id;
    Time created_at{};
};

// A unit of work against the store. Reads see the transaction's own writes. Nothing is visible to anyone else
// until commit(); a transaction destroyed without committing is rolled back.
class Transaction {
public:
    virtual ~Transaction() = default;

    [[nodiscard]] virtual std::optional<UserRecord> find_user(const std::string &id) const = 0;
    // Names are matched case insensitively.
    [[nodiscard]] virtual std::optional<UserRecord> find_user_by_name(std::string_view username) const = 0;
    [[nodiscard]] virtual std::optional<UserRecord> find_user_by_email(std::string_view email) const = 0;
    [[nodiscard]] virtual std::optional<CharacterRecord> find_character(const std::string &id) const = 0;
    [[nodiscard]] virtual std::optional<CharacterRecord> find_character_by_name(std::string_view name) const = 0;
    [[nodiscard]] virtual std::vector<CharacterRecord> characters_for(const std::string &user_id) const = 0;

    virtual void put_user(UserRecord user) = 0;
    virtual void put_character(CharacterRecord character) = 0;
    virtual bool erase_character(const std::string &id) = 0;

    // Throws DatabaseError if the changes clash with committed data (e.g. a name already in use) or can't be
    // saved; the store is then unchanged.
    virtual void commit() = 0;
    virtual void rollback() = 0;
};

class Database {
public:
    virtual ~Database() = default;
    [[nodiscard]] virtual std::unique_ptr<Transaction> begin() = 0;
};

// A new random identifier for a record.
[[nodiscard]] std::string make_record_id();
