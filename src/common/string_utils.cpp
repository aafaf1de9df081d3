#include "string_utils.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include <algorithm>
#include <cctype>
#include <regex>
#include <utility>

std::string smash_tilde(std::string_view str) {
    return str | ranges::views::transform([](char c) { return c == '~' ? '-' : c; }) | ranges::to<std::string>;
}

namespace {
const auto not_space = [](char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
}

std::string_view ltrim(std::string_view str) {
    const auto begin = std::find_if(str.begin(), str.end(), not_space);
    return {begin, static_cast<size_t>(str.end() - begin)};
}

std::string_view trim(std::string_view str) {
    const auto begin = std::find_if(str.begin(), str.end(), not_space);
    const auto rit = std::find_if(str.rbegin(), std::make_reverse_iterator(begin), not_space);
    return {begin, static_cast<size_t>(rit.base() - begin)};
}

std::vector<std::string> split_words(std::string_view str) {
    std::vector<std::string> words;
    for (str = ltrim(str); !str.empty(); str = ltrim(str)) {
        auto end = std::find_if(str.begin(), str.end(), [](char ch) { return !not_space(ch); });
        const auto length = static_cast<size_t>(end - str.begin());
        words.emplace_back(str.substr(0, length));
        str.remove_prefix(length);
    }
    return words;
}

std::string lower_case(std::string_view str) {
    return str | ranges::views::transform([](unsigned char c) { return static_cast<char>(std::tolower(c)); })
           | ranges::to<std::string>;
}

namespace {

std::string decode_colour(bool ansi_enabled, char char_code) {
    char send_colour;
    switch (char_code) {
    case 'r':
    case 'R': send_colour = '1'; break;
    case 'g':
    case 'G': send_colour = '2'; break;
    case 'y':
    case 'Y': send_colour = '3'; break;
    case 'b':
    case 'B': send_colour = '4'; break;
    case 'm':
    case 'M': send_colour = '5'; break;
    case 'c':
    case 'C': send_colour = '6'; break;
    case 'w':
    case 'W': send_colour = '7'; break;
    case 'p':
    case 'P': return ansi_enabled ? "\033[0m" : "";
    case '|': return "|";
    default: return std::string(1, char_code); // NOLINT(modernize-return-braced-init-list)
    }
    if (ansi_enabled)
        return fmt::format("\033[{};3{}m", char_code >= 'a' ? '0' : '1', send_colour);
    return "";
}

}

std::string colourise_mud_string(bool use_ansi, std::string_view text) {
    std::string buf;
    bool prev_was_pipe = false;
    for (auto c : text) {
        if (std::exchange(prev_was_pipe, false))
            buf += decode_colour(use_ansi, c);
        else if (c == '|')
            prev_was_pipe = true;
        else
            buf.push_back(c);
    }
    return buf;
}

std::string strip_ansi(std::string_view text) {
    static const std::regex ansi_escape("\x1b\\[[0-9;]*m");
    return std::regex_replace(std::string(text), ansi_escape, "");
}

std::string normalise_line_endings(std::string_view text) {
    std::string result;
    result.reserve(text.size() + text.size() / 16);
    char previous = 0;
    for (auto c : text) {
        if (c == '\n' && previous != '\r')
            result.push_back('\r');
        result.push_back(c);
        previous = c;
    }
    return result;
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs),
                          [](auto pr) {
                              return std::tolower(static_cast<unsigned char>(pr.first))
                                     == std::tolower(static_cast<unsigned char>(pr.second));
                          });
}

bool matches_start(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() > rhs.size() || lhs.empty())
        return false;
    return matches(lhs, rhs.substr(0, lhs.size()));
}
