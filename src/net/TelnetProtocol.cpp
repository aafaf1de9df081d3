#include "TelnetProtocol.hpp"

#include "common/string_utils.hpp"

#include <arpa/telnet.h>

#include <algorithm>
#include <array>
#include <utility>

namespace {

constexpr byte Backspace = 0x08;
constexpr byte Delete = 0x7f;
constexpr byte Interrupt = 0x03;
constexpr byte FirstPrintable = 0x20;

bool supports_ansi(std::string_view detected_term) {
    static constexpr std::array<std::string_view, 8> ansi_terms{"xterm", "mudlet", "ansi",       "vt100",
                                                                "vt102", "vt220",  "terminator", "tintin"};
    for (auto &ansi_term : ansi_terms)
        if (matches_start(ansi_term, detected_term))
            return true;
    return false;
}

bool is_two_byte_command(byte b) {
    return b == NOP || b == DM || b == BREAK || b == IP || b == ABORT || b == AYT || b == EC || b == EL || b == GA
           || b == IAC || b < SE;
}

bool is_utf8_continuation(char c) { return (static_cast<byte>(c) & 0xc0u) == 0x80u; }

}

void TelnetProtocol::send_com(byte a, byte b) {
    const byte buf[] = {IAC, a, b};
    handler_.send_bytes(buf);
}

void TelnetProtocol::send_opt(byte a) {
    const byte buf[] = {IAC, SB, a, TELQUAL_SEND, IAC, SE};
    handler_.send_bytes(buf);
}

void TelnetProtocol::echo(std::string_view text) {
    if (echoing())
        handler_.send_bytes(gsl::span<const byte>(reinterpret_cast<const byte *>(text.data()), text.size()));
}

void TelnetProtocol::add_data(gsl::span<const byte> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
    size_t pos = 0;
    while (pos < buffer_.size()) {
        if (buffer_[pos] == IAC) {
            auto num_consumed = on_command(gsl::span<const byte>(buffer_).subspan(pos));
            // Not enough data for the whole command yet: keep it until more arrives.
            if (num_consumed == 0)
                break;
            if (num_consumed == 2 && buffer_[pos + 1] == IP) {
                interrupt();
                return;
            }
            pos += num_consumed;
            continue;
        }
        if (buffer_[pos] == Interrupt) {
            interrupt();
            return;
        }
        on_data_byte(buffer_[pos++]);
    }
    buffer_.erase(buffer_.begin(), std::next(buffer_.begin(), static_cast<long>(pos)));
}

void TelnetProtocol::on_data_byte(byte b) {
    if (b == '\r' || b == '\n') {
        // The second half of a \r\n or \n\r pair; even if it crossed a buffer boundary.
        if (previous_separator_ && previous_separator_ != b) {
            previous_separator_ = 0;
            return;
        }
        previous_separator_ = b;
        echo("\r\n");
        handler_.on_line(std::exchange(line_, {}));
        return;
    }
    // Telnet NVT sends a bare carriage return as CR NUL.
    if (std::exchange(previous_separator_, 0) == '\r' && b == 0)
        return;
    if (b == Backspace || b == Delete) {
        erase_character();
        return;
    }
    if (b < FirstPrintable)
        return;
    line_.push_back(static_cast<char>(b));
    const char as_char = static_cast<char>(b);
    echo(std::string_view(&as_char, 1));
}

void TelnetProtocol::erase_character() {
    if (line_.empty())
        return;
    // Remove a whole UTF-8 sequence, not just its last byte.
    while (line_.size() > 1 && is_utf8_continuation(line_.back()))
        line_.pop_back();
    line_.pop_back();
    echo("\b \b");
}

void TelnetProtocol::erase_line() {
    while (!line_.empty())
        erase_character();
}

void TelnetProtocol::interrupt() {
    buffer_.clear();
    line_.clear();
    previous_separator_ = 0;
    handler_.on_interrupt();
}

void TelnetProtocol::send_telopts() {
    send_com(WILL, TELOPT_ECHO);
    send_com(WILL, TELOPT_SGA);
    send_com(DO, TELOPT_TTYPE);
    send_com(DO, TELOPT_NAWS);
}

size_t TelnetProtocol::on_subcommand(gsl::span<const byte> command_sequence) {
    auto option_code = command_sequence[2];
    static constexpr auto outer_command_length = 3;
    auto body = command_sequence.subspan(outer_command_length);
    const std::array<byte, 2> iac_se = {IAC, SE};
    auto iac_se_it = std::search(body.begin(), body.end(), iac_se.begin(), iac_se.end());
    if (iac_se_it == body.end())
        return 0;
    body = body.subspan(0, static_cast<size_t>(std::distance(body.begin(), iac_se_it)));
    switch (option_code) {
    case TELOPT_TTYPE:
        // The body is TELQUAL_IS followed by the name.
        if (body.size() > 1) {
            std::string term(reinterpret_cast<const char *>(body.data() + 1), body.size() - 1);
            ansi_ = ::supports_ansi(term);
            handler_.on_terminal_type(term, ansi_);
        }
        break;

    case TELOPT_NAWS:
        if (body.size() >= 4) {
            width_ = (static_cast<unsigned int>(body[0]) << 8u) | static_cast<unsigned int>(body[1]);
            height_ = (static_cast<unsigned int>(body[2]) << 8u) | static_cast<unsigned int>(body[3]);
            handler_.on_terminal_size(width_, height_);
        }
        break;
    default: break;
    }
    return outer_command_length + body.size() + iac_se.size();
}

size_t TelnetProtocol::on_command(gsl::span<const byte> command_sequence) {
    if (command_sequence.size() < 2)
        return 0;
    auto command = command_sequence[1];
    if (is_two_byte_command(command)) {
        switch (command) {
        case IAC: on_data_byte(IAC); break;
        case EC: erase_character(); break;
        case EL: erase_line(); break;
        default: break;
        }
        return 2;
    }
    // If there's not enough space for a [WILL WONT DO DONT SB] [option]... return
    if (command_sequence.size() < 3)
        return 0;
    auto option_code = command_sequence[2];
    switch (command) {
    default: break;
    case WILL:
        switch (option_code) {
        case TELOPT_TTYPE:
            // Some clients answer repeatedly; only ask for the terminal type once.
            if (!got_term_) {
                got_term_ = true;
                send_opt(option_code);
            }
            break;
        case TELOPT_NAWS:
        case TELOPT_SGA:
            // Nothing to do: the data follows in subnegotiations, or is already what we expect.
            break;
        default: send_com(DONT, option_code); break;
        }
        return 3;
    case WONT: send_com(DONT, option_code); return 3;
    case DO:
        switch (option_code) {
        case TELOPT_ECHO: client_refused_echo_ = false; break;
        case TELOPT_SGA: break;
        default: send_com(WONT, option_code); break;
        }
        return 3;
    case DONT:
        if (option_code == TELOPT_ECHO)
            client_refused_echo_ = true;
        send_com(WONT, option_code);
        return 3;
    case SB: return on_subcommand(command_sequence);
    }
    // Any other three byte sequence is not something a client should send; skip it.
    return 3;
}
