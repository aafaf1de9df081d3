#pragma once

#include "common/Byte.hpp"

#include <gsl/span>

#include <string>
#include <string_view>
#include <vector>

// Interprets the client side of a telnet session: option negotiation, subnegotiation of terminal type and window
// size, and character-at-a-time line editing. Completed lines and other events are reported through the Handler.
class TelnetProtocol {
public:
    struct Handler {
        virtual ~Handler() = default;
        virtual void send_bytes(gsl::span<const byte> data) = 0;
        virtual void on_line(std::string_view line) = 0;
        virtual void on_interrupt() = 0;
        virtual void on_terminal_size(unsigned int width, unsigned int height) = 0;
        virtual void on_terminal_type(std::string_view type, bool ansi_supported) = 0;
    };

private:
    Handler &handler_;
    std::vector<byte> buffer_;
    std::string line_;
    bool got_term_ = false;
    bool echo_requested_ = true;
    bool client_refused_echo_ = false;
    unsigned int width_ = 80;
    unsigned int height_ = 24;
    bool ansi_ = false;
    byte previous_separator_ = 0;

    void send_com(byte a, byte b);
    void send_opt(byte a);
    void echo(std::string_view text);

    // Returns the number of bytes consumed, or zero to indicate no complete subcommand found.
    size_t on_subcommand(gsl::span<const byte> command_sequence);
    // Returns the number of bytes consumed, or zero to indicate no complete command found.
    size_t on_command(gsl::span<const byte> command_sequence);
    void on_data_byte(byte b);
    void erase_character();
    void erase_line();
    void interrupt();

public:
    explicit TelnetProtocol(Handler &handler) : handler_(handler) {}

    // Unparsed bytes plus the partially edited line.
    [[nodiscard]] size_t buffered_data_size() const { return buffer_.size() + line_.size(); }
    void add_data(gsl::span<const byte> data);
    // Whether typed characters should be echoed back for the current line.
    void set_echo(bool echo) { echo_requested_ = echo; }
    [[nodiscard]] bool echoing() const { return echo_requested_ && !client_refused_echo_; }

    [[nodiscard]] bool supports_ansi() const { return ansi_; }
    [[nodiscard]] unsigned int width() const { return width_; }
    [[nodiscard]] unsigned int height() const { return height_; }
    void send_telopts();
};
