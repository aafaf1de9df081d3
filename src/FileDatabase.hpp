/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include "Database.hpp"
#include "common/Logger.hpp"

#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// Keeps every record in memory and, when given a directory, rewrites users.dat and characters.dat there on each
// commit. Without a directory nothing touches the disk.
class FileDatabase : public Database {
public:
    using UserTable = std::map<std::string, UserRecord>;
    using CharacterTable = std::map<std::string, CharacterRecord>;

private:
    class FileTransaction;

    mutable Logger log_;
    std::optional<std::string> data_dir_;
    mutable std::mutex mutex_;
    UserTable users_;
    CharacterTable characters_;

    void load();
    void save(const UserTable &users, const CharacterTable &characters) const;

public:
    explicit FileDatabase(std::optional<std::string> data_dir = std::nullopt);

    [[nodiscard]] std::unique_ptr<Transaction> begin() override;
};

// Exposed for tests: the text form of the two tables.
void write_users(FILE *fp, const FileDatabase::UserTable &users);
void write_characters(FILE *fp, const FileDatabase::CharacterTable &characters);
[[nodiscard]] FileDatabase::UserTable read_users(FILE *fp);
[[nodiscard]] FileDatabase::CharacterTable read_characters(FILE *fp);
