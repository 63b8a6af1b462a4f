#include "config.h"
#include "errors.h"
#include "fs.h"
#include <cctype>
#include <cerrno>
#include <vector>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)

namespace dirpost {

const char* role_to_string(Role role) {
    switch (role) {
        case Role::Initiator: return "client";
        case Role::Listener: return "server";
        default: return "unknown";
    }
}

const char* direction_to_string(Direction direction) {
    switch (direction) {
        case Direction::Send: return "sending";
        case Direction::Receive: return "receiving";
        default: return "unknown";
    }
}

Direction negotiate_direction(Role role, bool reverse) {
    bool listener = role == Role::Listener;
    // Listener receives unless reversed; Initiator is the mirror image
    bool sending = listener == reverse;
    return sending ? Direction::Send : Direction::Receive;
}

uint16_t parse_port(const std::string& text, bool allow_zero) {
    if (text.empty() || text.size() > 5) {
        throw ConfigError("invalid port '" + text + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError("invalid port '" + text + "'");
        }
    }

    unsigned long value = std::stoul(text);
    if (value > 65535 || (value == 0 && !allow_zero)) {
        throw ConfigError("port " + text + " out of range");
    }
    return static_cast<uint16_t>(value);
}

void apply_config_json(const nlohmann::json& json, SessionConfig& config) {
    if (!json.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    try {
        for (auto it = json.begin(); it != json.end(); ++it) {
            const std::string& key = it.key();
            const nlohmann::json& value = it.value();

            if (key == "directory") {
                config.root = value.get<std::string>();
            } else if (key == "host") {
                config.host = value.get<std::string>();
            } else if (key == "port") {
                if (!value.is_number_integer()) {
                    throw ConfigError("'port' must be an integer");
                }
                int64_t port = value.get<int64_t>();
                if (port < 0 || port > 65535) {
                    throw ConfigError("'port' " + std::to_string(port) + " out of range");
                }
                config.port = static_cast<uint16_t>(port);
            } else if (key == "reverse") {
                config.reverse = value.get<bool>();
            } else if (key == "log_level") {
                std::string name = value.get<std::string>();
                if (!parse_log_level(name, config.log_level)) {
                    throw ConfigError("unknown log level '" + name + "'");
                }
            } else if (key == "log_colors") {
                config.log_colors = value.get<bool>();
            } else if (key == "log_timestamps") {
                config.log_timestamps = value.get<bool>();
            } else {
                LOG_CONFIG_WARN("Ignoring unknown configuration key '" << key << "'");
            }
        }
    } catch (const nlohmann::json::type_error& e) {
        throw ConfigError(std::string("wrong value type in configuration: ") + e.what());
    }
}

void load_config_file(const std::string& path, SessionConfig& config) {
    LOG_CONFIG_DEBUG("Loading configuration from " << path);

    std::vector<uint8_t> data;
    if (!read_file_binary(path, data)) {
        throw ConfigError(errno_message("cannot read configuration file '" + path + "'", errno));
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(data.begin(), data.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse configuration file '" + path + "': " + e.what());
    }

    apply_config_json(json, config);
}

nlohmann::json config_to_json(const SessionConfig& config) {
    nlohmann::json json;
    json["directory"] = config.root;
    json["host"] = config.host;
    json["port"] = config.port;
    json["reverse"] = config.reverse;
    json["log_level"] = log_level_to_string(config.log_level);
    json["log_colors"] = config.log_colors;
    json["log_timestamps"] = config.log_timestamps;
    return json;
}

void validate_config(const SessionConfig& config) {
    if (config.root.empty()) {
        throw ConfigError("directory must not be empty");
    }
    if (config.role() == Role::Initiator && config.port == 0) {
        throw ConfigError("a port is required to connect to " + config.host);
    }
}

} // namespace dirpost
