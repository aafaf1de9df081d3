/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#include "DataFile.hpp"

#include "common/string_utils.hpp"

#include <fmt/format.h>

#include <cctype>
#include <cerrno>
#include <cstring>

FilePtr open_data_file(const std::string &path, const char *mode) {
    FilePtr fp(::fopen(path.c_str(), mode));
    if (!fp)
        throw DataFileError(fmt::format("Unable to open {}: {}", path, std::strerror(errno)));
    return fp;
}

void skip_ws(FILE *fp) {
    for (;;) {
        auto c = fgetc(fp);
        if (c == EOF)
            return;
        if (!std::isspace(c)) {
            ungetc(c, fp);
            return;
        }
    }
}

char fread_letter(FILE *fp) {
    int c;
    do {
        c = getc(fp);
    } while (std::isspace(c));
    if (c == EOF)
        throw DataFileError("fread_letter: unexpected end of file");
    return static_cast<char>(c);
}

long fread_number(FILE *fp) {
    int c;
    do {
        c = getc(fp);
    } while (std::isspace(c));

    bool negative = false;
    if (c == '+') {
        c = getc(fp);
    } else if (c == '-') {
        negative = true;
        c = getc(fp);
    }

    if (!std::isdigit(c))
        throw DataFileError("fread_number: bad format");

    long number = 0;
    while (std::isdigit(c)) {
        number = number * 10 + c - '0';
        c = getc(fp);
    }
    if (c != EOF && !std::isspace(c))
        ungetc(c, fp);
    return negative ? -number : number;
}

std::string fread_string(FILE *fp) {
    skip_ws(fp);
    std::string result;
    for (;;) {
        auto c = fgetc(fp);
        switch (c) {
        default: result += static_cast<char>(c); break;
        case EOF: throw DataFileError("fread_string: unterminated string");
        case '\r': break;
        case '~': return result;
        }
    }
}

void fread_to_eol(FILE *fp) {
    int c;

    do {
        c = getc(fp);
    } while (c != '\n' && c != '\r' && c != EOF);

    do {
        c = getc(fp);
    } while (c == '\n' || c == '\r');

    ungetc(c, fp);
}

std::optional<std::string> try_fread_word(FILE *fp) {
    std::string word;
    int letter;
    char got_quote{'\0'};
    do {
        letter = fgetc(fp);
    } while (std::isspace(letter));
    if (letter == EOF)
        return std::nullopt;
    for (;; letter = fgetc(fp)) {
        if (letter == EOF)
            return word;
        if (!got_quote && word.empty() && (letter == '\'' || letter == '"')) {
            got_quote = static_cast<char>(letter);
            continue;
        }
        if (got_quote ? letter == got_quote : std::isspace(letter)) {
            if (std::isspace(letter))
                ungetc(letter, fp);
            return word;
        }
        word.push_back(static_cast<char>(letter));
    }
}

std::string fread_word(FILE *fp) {
    if (auto word = try_fread_word(fp))
        return *word;
    throw DataFileError("fread_word: unexpected end of file");
}

void fwrite_string(FILE *fp, std::string_view key, std::string_view value) {
    fmt::print(fp, "{} {}~\n", key, smash_tilde(value));
}
