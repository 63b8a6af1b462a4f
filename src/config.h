#pragma once

/**
 * @file config.h
 * @brief Session configuration: defaults, JSON config file, validation
 */

#include "logger.h"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace dirpost {

constexpr uint16_t DEFAULT_PORT = 5555;

enum class Role {
    Initiator,      // Connects to a peer host
    Listener        // Binds and accepts one connection
};

enum class Direction {
    Send,
    Receive
};

const char* role_to_string(Role role);
const char* direction_to_string(Direction direction);

/**
 * @brief Which side sends
 *
 * Listener receives and Initiator sends, unless reverse is set, in which
 * case the two swap.
 */
Direction negotiate_direction(Role role, bool reverse);

/**
 * @brief Everything a session needs, fixed before any network activity
 */
struct SessionConfig {
    std::string root;               // Directory to send from or receive into
    std::string host;               // Peer to connect to; empty means listen
    uint16_t port;
    bool reverse;

    LogLevel log_level;
    bool log_colors;
    bool log_timestamps;

    SessionConfig()
        : root("."), port(DEFAULT_PORT), reverse(false),
          log_level(LogLevel::INFO), log_colors(true), log_timestamps(true) {}

    Role role() const { return host.empty() ? Role::Listener : Role::Initiator; }
    Direction direction() const { return negotiate_direction(role(), reverse); }
};

/**
 * @brief Apply the keys present in a JSON object on top of `config`
 *
 * Recognized keys: directory, host, port, reverse, log_level, log_colors,
 * log_timestamps. Unknown keys are ignored with a warning.
 *
 * @throws ConfigError on wrong value types or out-of-range values
 */
void apply_config_json(const nlohmann::json& json, SessionConfig& config);

/**
 * @brief Load a JSON config file on top of `config`
 * @throws ConfigError if the file cannot be read or parsed
 */
void load_config_file(const std::string& path, SessionConfig& config);

/**
 * @brief Serialize a configuration (the inverse of apply_config_json)
 */
nlohmann::json config_to_json(const SessionConfig& config);

/**
 * @brief Parse a port number in 1-65535 (0 allowed when listening)
 * @throws ConfigError
 */
uint16_t parse_port(const std::string& text, bool allow_zero);

/**
 * @brief Reject combinations that cannot run
 * @throws ConfigError
 */
void validate_config(const SessionConfig& config);

} // namespace dirpost
