/*************************************************************************/
/*  Waystone (M)ulti(U)ser(D)ungeon server source code                   */
/*  (C) 2026 Waystone Development Team                                   */
/*************************************************************************/
#pragma once

#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

// Readers and writers for the line-and-tilde text format used by area and player files:
// keywords separated by whitespace, free text terminated by '~'.

class DataFileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FileCloser {
    void operator()(FILE *fp) const noexcept { ::fclose(fp); }
};
using FilePtr = std::unique_ptr<FILE, FileCloser>;

// Opens a file, throwing DataFileError (with the OS error) on failure.
[[nodiscard]] FilePtr open_data_file(const std::string &path, const char *mode);

void skip_ws(FILE *fp);
// Reads the next non-whitespace character.
[[nodiscard]] char fread_letter(FILE *fp);
[[nodiscard]] long fread_number(FILE *fp);
// Reads text up to the next '~'. Carriage returns are dropped.
[[nodiscard]] std::string fread_string(FILE *fp);
void fread_to_eol(FILE *fp);
// Reads one word which can optionally begin with a single or double quote
// and must be terminated either with a whitespace, or with the same quote. Returns nothing at end of file.
[[nodiscard]] std::optional<std::string> try_fread_word(FILE *fp);
[[nodiscard]] std::string fread_word(FILE *fp);

// Writes "Key value~", replacing any tildes in the value.
void fwrite_string(FILE *fp, std::string_view key, std::string_view value);
