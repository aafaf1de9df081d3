/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "FileDatabase.hpp"
#include "DataFile.hpp"
#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <functional>
#include <map>
#include <utility>

namespace {

constexpr auto UsersFile = "users.dat";
constexpr auto CharactersFile = "characters.dat";

long to_epoch(Time time) {
    return static_cast<long>(std::chrono::duration_cast<Seconds>(time.time_since_epoch()).count());
}

Time from_epoch(long seconds) { return Time(Seconds(seconds)); }

// Applies pending changes (nullopt meaning "erased") over a committed table.
template <typename Table, typename Pending>
Table merged(const Table &committed, const Pending &pending) {
    auto result = committed;
    for (auto &[id, change] : pending) {
        if (change)
            result[id] = *change;
        else
            result.erase(id);
    }
    return result;
}

template <typename Table, typename NameOf>
void check_unique_names(const Table &table, NameOf name_of, std::string_view what) {
    std::map<std::string, std::string> seen;
    for (auto &[id, record] : table) {
        if (name_of(record).empty())
            continue;
        auto [it, inserted] = seen.emplace(lower_case(name_of(record)), id);
        if (!inserted)
            throw DatabaseError(fmt::format("The {} '{}' is already taken", what, name_of(record)));
    }
}

void write_file(const std::string &path, const std::function<void(FILE *)> &writer) {
    const auto tmp_path = path + ".tmp";
    try {
        auto fp = open_data_file(tmp_path, "w");
        writer(fp.get());
        if (::fflush(fp.get()) != 0 || ::ferror(fp.get()))
            throw DatabaseError(fmt::format("Unable to write {}: {}", tmp_path, std::strerror(errno)));
        if (::fclose(fp.release()) != 0)
            throw DatabaseError(fmt::format("Unable to close {}: {}", tmp_path, std::strerror(errno)));
    } catch (const DataFileError &error) {
        throw DatabaseError(error.what());
    }
    if (::rename(tmp_path.c_str(), path.c_str()) != 0)
        throw DatabaseError(fmt::format("Unable to rename {} to {}: {}", tmp_path, path, std::strerror(errno)));
}

template <typename Table, typename Reader>
Table read_file(const std::string &path, Reader reader) {
    if (!std::filesystem::exists(path))
        return {};
    try {
        auto fp = open_data_file(path, "r");
        return reader(fp.get());
    } catch (const DataFileError &error) {
        throw DatabaseError(fmt::format("{}: {}", path, error.what()));
    }
}

}

void write_users(FILE *fp, const FileDatabase::UserTable &users) {
    for (auto &[id, user] : users) {
        fmt::print(fp, "#USER\n");
        fwrite_string(fp, "Id", user.id);
        fwrite_string(fp, "Name", user.username);
        fwrite_string(fp, "Email", user.email);
        fwrite_string(fp, "Password", user.password_hash);
        fmt::print(fp, "Created {}\n", to_epoch(user.created_at));
        if (user.last_login)
            fmt::print(fp, "LastLogin {}\n", to_epoch(*user.last_login));
        fmt::print(fp, "End\n\n");
    }
    fmt::print(fp, "#END\n");
}

void write_characters(FILE *fp, const FileDatabase::CharacterTable &characters) {
    for (auto &[id, ch] : characters) {
        fmt::print(fp, "#CHARACTER\n");
        fwrite_string(fp, "Id", ch.id);
        fwrite_string(fp, "User", ch.user_id);
        fwrite_string(fp, "Name", ch.name);
        fwrite_string(fp, "Room", ch.room_id);
        fmt::print(fp, "Created {}\n", to_epoch(ch.created_at));
        fmt::print(fp, "End\n\n");
    }
    fmt::print(fp, "#END\n");
}

FileDatabase::UserTable read_users(FILE *fp) {
    FileDatabase::UserTable users;
    for (;;) {
        if (fread_letter(fp) != '#')
            throw DataFileError("read_users: # not found");
        const auto section = fread_word(fp);
        if (section == "END")
            break;
        if (section != "USER")
            throw DataFileError(fmt::format("read_users: bad section name '#{}'", section));
        UserRecord user;
        for (;;) {
            const auto key = fread_word(fp);
            if (key == "End")
                break;
            if (key == "Id")
                user.id = fread_string(fp);
            else if (key == "Name")
                user.username = fread_string(fp);
            else if (key == "Email")
                user.email = fread_string(fp);
            else if (key == "Password")
                user.password_hash = fread_string(fp);
            else if (key == "Created")
                user.created_at = from_epoch(fread_number(fp));
            else if (key == "LastLogin")
                user.last_login = from_epoch(fread_number(fp));
            else
                throw DataFileError(fmt::format("read_users: unknown key '{}'", key));
        }
        if (user.id.empty())
            throw DataFileError(fmt::format("read_users: user '{}' has no id", user.username));
        auto id = user.id;
        users.emplace(std::move(id), std::move(user));
    }
    return users;
}

FileDatabase::CharacterTable read_characters(FILE *fp) {
    FileDatabase::CharacterTable characters;
    for (;;) {
        if (fread_letter(fp) != '#')
            throw DataFileError("read_characters: # not found");
        const auto section = fread_word(fp);
        if (section == "END")
            break;
        if (section != "CHARACTER")
            throw DataFileError(fmt::format("read_characters: bad section name '#{}'", section));
        CharacterRecord ch;
        for (;;) {
            const auto key = fread_word(fp);
            if (key == "End")
                break;
            if (key == "Id")
                ch.id = fread_string(fp);
            else if (key == "User")
                ch.user_id = fread_string(fp);
            else if (key == "Name")
                ch.name = fread_string(fp);
            else if (key == "Room")
                ch.room_id = fread_string(fp);
            else if (key == "Created")
                ch.created_at = from_epoch(fread_number(fp));
            else
                throw DataFileError(fmt::format("read_characters: unknown key '{}'", key));
        }
        if (ch.id.empty())
            throw DataFileError(fmt::format("read_characters: character '{}' has no id", ch.name));
        auto id = ch.id;
        characters.emplace(std::move(id), std::move(ch));
    }
    return characters;
}

class FileDatabase::FileTransaction : public Transaction {
    FileDatabase &db_;
    std::map<std::string, std::optional<UserRecord>> users_;
    std::map<std::string, std::optional<CharacterRecord>> characters_;
    bool finished_{};

    // Committed view with this transaction's changes applied.
    [[nodiscard]] UserTable users() const {
        std::lock_guard lock(db_.mutex_);
        return merged(db_.users_, users_);
    }
    [[nodiscard]] CharacterTable characters() const {
        std::lock_guard lock(db_.mutex_);
        return merged(db_.characters_, characters_);
    }

public:
    explicit FileTransaction(FileDatabase &db) : db_(db) {}
    ~FileTransaction() override {
        if (!finished_)
            rollback();
    }

    std::optional<UserRecord> find_user(const std::string &id) const override {
        if (auto it = users_.find(id); it != users_.end())
            return it->second;
        std::lock_guard lock(db_.mutex_);
        if (auto it = db_.users_.find(id); it != db_.users_.end())
            return it->second;
        return {};
    }

    std::optional<UserRecord> find_user_by_name(std::string_view username) const override {
        for (auto &[id, user] : users())
            if (matches(user.username, username))
                return user;
        return {};
    }

    std::optional<UserRecord> find_user_by_email(std::string_view email) const override {
        for (auto &[id, user] : users())
            if (matches(user.email, email))
                return user;
        return {};
    }

    std::optional<CharacterRecord> find_character(const std::string &id) const override {
        if (auto it = characters_.find(id); it != characters_.end())
            return it->second;
        std::lock_guard lock(db_.mutex_);
        if (auto it = db_.characters_.find(id); it != db_.characters_.end())
            return it->second;
        return {};
    }

    std::optional<CharacterRecord> find_character_by_name(std::string_view name) const override {
        for (auto &[id, ch] : characters())
            if (matches(ch.name, name))
                return ch;
        return {};
    }

    std::vector<CharacterRecord> characters_for(const std::string &user_id) const override {
        std::vector<CharacterRecord> result;
        for (auto &[id, ch] : characters())
            if (ch.user_id == user_id)
                result.push_back(ch);
        std::sort(result.begin(), result.end(),
                  [](const CharacterRecord &a, const CharacterRecord &b) { return a.created_at < b.created_at; });
        return result;
    }

    void put_user(UserRecord user) override {
        auto id = user.id;
        users_[std::move(id)] = std::move(user);
    }

    void put_character(CharacterRecord character) override {
        auto id = character.id;
        characters_[std::move(id)] = std::move(character);
    }

    bool erase_character(const std::string &id) override {
        if (!find_character(id))
            return false;
        characters_[id] = std::nullopt;
        return true;
    }

    void commit() override {
        if (finished_)
            throw DatabaseError("Transaction already finished");
        std::lock_guard lock(db_.mutex_);
        auto new_users = merged(db_.users_, users_);
        auto new_characters = merged(db_.characters_, characters_);
        check_unique_names(new_users, [](const UserRecord &u) { return u.username; }, "user name");
        check_unique_names(new_users, [](const UserRecord &u) { return u.email; }, "email address");
        check_unique_names(new_characters, [](const CharacterRecord &c) { return c.name; }, "character name");
        for (auto &[id, ch] : new_characters)
            if (!new_users.count(ch.user_id))
                throw DatabaseError(fmt::format("Character '{}' belongs to unknown user {}", ch.name, ch.user_id));
        db_.save(new_users, new_characters);
        db_.users_ = std::move(new_users);
        db_.characters_ = std::move(new_characters);
        finished_ = true;
        db_.log_.debug("Committed {} user and {} character changes", users_.size(), characters_.size());
    }

    void rollback() override {
        if (!users_.empty() || !characters_.empty())
            db_.log_.debug("Rolling back {} user and {} character changes", users_.size(), characters_.size());
        users_.clear();
        characters_.clear();
        finished_ = true;
    }
};

FileDatabase::FileDatabase(std::optional<std::string> data_dir)
    : log_(logger_for("FileDatabase")), data_dir_(std::move(data_dir)) {
    load();
}

std::unique_ptr<Transaction> FileDatabase::begin() { return std::make_unique<FileTransaction>(*this); }

void FileDatabase::load() {
    if (!data_dir_)
        return;
    const auto dir = std::filesystem::path(*data_dir_);
    users_ = read_file<UserTable>((dir / UsersFile).string(), read_users);
    characters_ = read_file<CharacterTable>((dir / CharactersFile).string(), read_characters);
    log_.info("Loaded {} users and {} characters from {}", users_.size(), characters_.size(), *data_dir_);
}

void FileDatabase::save(const UserTable &users, const CharacterTable &characters) const {
    if (!data_dir_)
        return;
    const auto dir = std::filesystem::path(*data_dir_);
    write_file((dir / UsersFile).string(), [&users](FILE *fp) { write_users(fp, users); });
    write_file((dir / CharactersFile).string(), [&characters](FILE *fp) { write_characters(fp, characters); });
}
