#include "config.h"
#include "errors.h"
#include "logger.h"
#include "session.h"
#include "transfer_engine.h"
#include "version.h"
#include <iostream>
#include <string>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)

namespace {

void print_usage(const char* program_name) {
    std::cout << "Post a directory to another host over one TCP connection.\n\n";
    std::cout << "Usage: " << program_name << " [-d DIR] [-i HOST] [-p PORT] [-r] [-c FILE] [-v] [--log-level LEVEL]\n\n";
    std::cout << "  server mode (receiving): -d dir -p port\n";
    std::cout << "  client mode (  sending): -d dir -p port -i host\n";
    std::cout << "  server mode (  sending): -d dir -p port -r\n";
    std::cout << "  client mode (receiving): -d dir -p port -r -i host\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --directory DIR    Directory to send from or receive into (default: .)\n";
    std::cout << "  -i, --ip-host HOST     Host to connect to; listen when omitted\n";
    std::cout << "  -p, --port PORT        Port to listen on or connect to (default: " << dirpost::DEFAULT_PORT << ")\n";
    std::cout << "  -r, --reverse          Swap sending and receiving sides\n";
    std::cout << "  -c, --config FILE      JSON configuration file, overridden by flags\n";
    std::cout << "  -v, --verbose          Debug logging\n";
    std::cout << "      --log-level LEVEL  debug, info, warn or error\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "  -V, --version          Show version and protocol version\n";
}

// Flags given on the command line, applied on top of the config file
struct CommandLine {
    std::string config_file;
    bool has_root = false;
    std::string root;
    bool has_host = false;
    std::string host;
    bool has_port = false;
    std::string port;
    bool reverse = false;
    bool has_log_level = false;
    std::string log_level;
    bool show_help = false;
    bool show_version = false;
};

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cli;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw dirpost::ConfigError("option " + name + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "-d" || arg == "--directory") {
            cli.has_root = true;
            cli.root = value(arg);
        } else if (arg == "-i" || arg == "--ip-host") {
            cli.has_host = true;
            cli.host = value(arg);
        } else if (arg == "-p" || arg == "--port") {
            cli.has_port = true;
            cli.port = value(arg);
        } else if (arg == "-r" || arg == "--reverse") {
            cli.reverse = true;
        } else if (arg == "-c" || arg == "--config") {
            cli.config_file = value(arg);
        } else if (arg == "-v" || arg == "--verbose") {
            cli.has_log_level = true;
            cli.log_level = "debug";
        } else if (arg == "--log-level") {
            cli.has_log_level = true;
            cli.log_level = value(arg);
        } else if (arg == "-h" || arg == "--help") {
            cli.show_help = true;
        } else if (arg == "-V" || arg == "--version") {
            cli.show_version = true;
        } else {
            throw dirpost::ConfigError("unknown argument '" + arg + "'");
        }
    }

    return cli;
}

dirpost::SessionConfig build_config(const CommandLine& cli) {
    dirpost::SessionConfig config;

    if (!cli.config_file.empty()) {
        dirpost::load_config_file(cli.config_file, config);
    }

    if (cli.has_root) config.root = cli.root;
    if (cli.has_host) config.host = cli.host;
    if (cli.has_port) config.port = dirpost::parse_port(cli.port, config.host.empty());
    if (cli.reverse) config.reverse = true;
    if (cli.has_log_level && !dirpost::parse_log_level(cli.log_level, config.log_level)) {
        throw dirpost::ConfigError("unknown log level '" + cli.log_level + "'");
    }

    dirpost::validate_config(config);
    return config;
}

void apply_logging(const dirpost::SessionConfig& config) {
    dirpost::Logger& logger = dirpost::Logger::getInstance();
    logger.set_log_level(config.log_level);
    logger.set_colors_enabled(config.log_colors);
    logger.set_timestamps_enabled(config.log_timestamps);
}

int run(const dirpost::SessionConfig& config) {
    bool server_mode = config.role() == dirpost::Role::Listener;
    const char* direction = dirpost::direction_to_string(config.direction());

    dirpost::version::print_header();
    std::cout << "mode: " << dirpost::role_to_string(config.role()) << " " << direction << std::endl;
    std::cout << "port: " << config.port << std::endl;
    std::cout << " dir: " << config.root << std::endl;

    dirpost::SessionNegotiator negotiator(config);
    if (server_mode) {
        uint16_t port = negotiator.bind();
        std::cout << "----------------------------------------" << std::endl;
        std::cout << "start  listening on: " << port << std::endl;
    }

    dirpost::Session session = negotiator.establish();
    if (!server_mode) {
        std::cout << "----------------------------------------" << std::endl;
    } else if (!session.peer.empty()) {
        std::cout << "new connection from: " << session.peer << std::endl;
    }
    std::cout << direction << " directory: " << session.root << std::endl;
    std::cout << "----------------------------------------" << std::endl;

    dirpost::TransferEngine engine(session);
    dirpost::TransferStats stats = engine.run();

    std::cout << "DONE: " << stats.directories << " directories, " << stats.files
              << " files, " << stats.bytes << " bytes" << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cli = parse_command_line(argc, argv);
        if (cli.show_help) {
            print_usage(argv[0]);
            return 0;
        }
        if (cli.show_version) {
            dirpost::version::print_version_info();
            return 0;
        }

        dirpost::SessionConfig config = build_config(cli);
        apply_logging(config);
        LOG_MAIN_DEBUG("Configuration: " << dirpost::config_to_json(config).dump());

        return run(config);
    } catch (const dirpost::TransferError& e) {
        std::cerr << "ERROR: " << dirpost::error_kind_to_string(e.kind()) << ": " << e.what() << std::endl;
        return dirpost::error_kind_exit_code(e.kind());
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
