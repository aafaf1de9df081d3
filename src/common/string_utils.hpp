#pragma once

#include <string>
#include <string_view>
#include <vector>

// Replace all tildes with dashes, so the text can be written safely into a tilde-terminated file field.
[[nodiscard]] std::string smash_tilde(std::string_view str);
// Trims leading whitespace, referencing the original string.
[[nodiscard]] std::string_view ltrim(std::string_view str);
// Trims leading and trailing whitespace, referencing the original string.
[[nodiscard]] std::string_view trim(std::string_view str);
// Splits on runs of whitespace. Never returns empty words.
[[nodiscard]] std::vector<std::string> split_words(std::string_view str);

// Returns the string, lower-cased.
[[nodiscard]] std::string lower_case(std::string_view str);

// Colourises (or strips out, if use_ansi is false) the pipe-delimited text format we use for colour: |R red,
// |g green etc, with || for a literal pipe.
[[nodiscard]] std::string colourise_mud_string(bool use_ansi, std::string_view text);

// Removes ANSI SGR escape sequences (ESC [ digits-and-semicolons m) from already-colourised text.
[[nodiscard]] std::string strip_ansi(std::string_view text);

// Converts every bare \n to \r\n, leaving existing \r\n pairs alone.
[[nodiscard]] std::string normalise_line_endings(std::string_view text);

// Compares two strings: are they referring to the same thing. That currently means "case insensitive comparison".
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Similar to matches() but checks if rhs starts with lhs, case insensitively.
// lhs must be at least one character long and must not be longer than rhs.
[[nodiscard]] bool matches_start(std::string_view lhs, std::string_view rhs);
