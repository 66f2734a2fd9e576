#include "pqshare/core/cli.hpp"
#include "pqshare/core/logger.hpp"
#include <charconv>
#include <iomanip>

namespace pqshare::core {

namespace {

enum class ValueKind {
    FLAG,
    TEXT,
    COUNT,          // non-negative integer
    NETWORK_MODE,
    BITRATE_MODE,
    LOG_LEVEL
};

struct OptionSpec {
    char short_name;
    const char* long_name;
    ValueKind kind;
    const char* config_key;     // nullptr for options handled by the parser itself
    const char* description;
};

const OptionSpec OPTIONS[] = {
    {'h', "help", ValueKind::FLAG, nullptr, "Show this help message"},
    {'V', "version", ValueKind::FLAG, nullptr, "Show version information"},
    {'v', "verbose", ValueKind::FLAG, nullptr, "Log at debug level"},
    {'c', "config", ValueKind::TEXT, nullptr, "Configuration file (default: pqshare.conf)"},
    {'m', "mode", ValueKind::NETWORK_MODE, "network.mode", "Network path: lan or wan"},
    {'b', "bitrate", ValueKind::BITRATE_MODE, "bitrate.mode", "Rate policy: aggressive, balanced or conservative"},
    {'p', "port", ValueKind::COUNT, "network.port", "TCP port to listen on or connect to"},
    {'t', "timeout", ValueKind::COUNT, "peer.timeout_s", "Seconds to wait for a peer"},
    {0, "bandwidth", ValueKind::COUNT, "send.bandwidth_limit", "Send ceiling in bytes per second, 0 for none"},
    {0, "max-downloads", ValueKind::COUNT, "send.max_downloads", "Stop serving the share after this many downloads"},
    {0, "expires-hours", ValueKind::COUNT, "send.expires_hours", "Stop serving the share after this many hours"},
    {0, "resume-db", ValueKind::TEXT, "resume.database", "SQLite file holding resumable sessions"},
    {0, "log-level", ValueKind::LOG_LEVEL, "log.level", "trace, debug, info, warn, error or critical"},
    {0, "log-file", ValueKind::TEXT, "log.file", "Log file path"},
};

const OptionSpec* find_long(const std::string& name) {
    for (const auto& spec : OPTIONS) {
        if (name == spec.long_name) {
            return &spec;
        }
    }
    return nullptr;
}

const OptionSpec* find_short(char name) {
    for (const auto& spec : OPTIONS) {
        if (spec.short_name != 0 && spec.short_name == name) {
            return &spec;
        }
    }
    return nullptr;
}

bool is_count(const std::string& value) {
    std::uint64_t parsed = 0;
    auto end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    return !value.empty() && ec == std::errc() && ptr == end;
}

bool is_log_level(const std::string& value) {
    // Two different fallbacks agree only for a recognised name
    return parse_log_level(value, LogLevel::Trace) == parse_log_level(value, LogLevel::Critical);
}

std::optional<std::string> check_value(const OptionSpec& spec, const std::string& value) {
    switch (spec.kind) {
        case ValueKind::FLAG:
        case ValueKind::TEXT:
            if (value.empty() && spec.kind == ValueKind::TEXT) {
                return std::string("--") + spec.long_name + " needs a non-empty value";
            }
            return std::nullopt;
        case ValueKind::COUNT:
            if (!is_count(value)) {
                return std::string("--") + spec.long_name + " expects a non-negative integer, got '" + value + "'";
            }
            return std::nullopt;
        case ValueKind::NETWORK_MODE:
            if (!parse_network_mode(value)) {
                return "Unknown network mode '" + value + "'";
            }
            return std::nullopt;
        case ValueKind::BITRATE_MODE:
            if (!parse_bitrate_mode(value)) {
                return "Unknown bitrate mode '" + value + "'";
            }
            return std::nullopt;
        case ValueKind::LOG_LEVEL:
            if (!is_log_level(value)) {
                return "Unknown log level '" + value + "'";
            }
            return std::nullopt;
    }
    return std::nullopt;
}

// Returns an error message, or nullopt once the option is recorded
std::optional<std::string> record(const OptionSpec& spec, const std::string& value, Invocation& invocation) {
    if (auto problem = check_value(spec, value)) {
        return problem;
    }

    std::string name = spec.long_name;
    if (name == "help") {
        invocation.show_help = true;
    } else if (name == "version") {
        invocation.show_version = true;
    } else if (name == "verbose") {
        invocation.verbose = true;
    } else if (name == "config") {
        invocation.config_file = value;
    } else if (spec.config_key) {
        invocation.overrides[spec.config_key] = value;
    }
    return std::nullopt;
}

}

const std::string& Invocation::command() const {
    static const std::string none;
    return args.empty() ? none : args.front();
}

std::optional<Invocation> CommandLine::parse(const std::vector<std::string>& argv, std::string& error) {
    Invocation invocation;
    bool options_done = false;

    for (std::size_t i = 1; i < argv.size(); ++i) {
        const auto& arg = argv[i];

        // Options may sit anywhere before a bare "--"
        if (options_done || arg.empty() || arg[0] != '-' || arg == "-") {
            invocation.args.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        const OptionSpec* spec = nullptr;
        std::optional<std::string> inline_value;
        if (arg.starts_with("--")) {
            auto eq = arg.find('=');
            auto name = arg.substr(2, eq == std::string::npos ? std::string::npos : eq - 2);
            spec = find_long(name);
            if (!spec) {
                error = "Unknown option --" + name;
                return std::nullopt;
            }
            if (eq != std::string::npos) {
                inline_value = arg.substr(eq + 1);
            }
        } else {
            spec = find_short(arg[1]);
            if (!spec) {
                error = std::string("Unknown option -") + arg[1];
                return std::nullopt;
            }
            if (arg.size() > 2) {
                inline_value = arg.substr(2);
            }
        }

        std::string value;
        if (spec->kind == ValueKind::FLAG) {
            if (inline_value) {
                error = std::string("--") + spec->long_name + " takes no value";
                return std::nullopt;
            }
        } else if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < argv.size()) {
            value = argv[++i];
        } else {
            error = std::string("--") + spec->long_name + " requires a value";
            return std::nullopt;
        }

        if (auto problem = record(*spec, value, invocation)) {
            error = *problem;
            return std::nullopt;
        }
    }
    return invocation;
}

std::optional<Invocation> CommandLine::parse(int argc, char* argv[], std::string& error) {
    std::vector<std::string> args(argv, argv + argc);
    return parse(args, error);
}

void CommandLine::apply(const Invocation& invocation, Config& config) {
    for (const auto& [key, value] : invocation.overrides) {
        config.set(key, value);
    }
    if (invocation.verbose) {
        config.set("log.level", "debug");
    }
}

void CommandLine::print_usage(std::ostream& out) {
    out << "Usage: pqshare [options] <command> [args...]\n\n";
    out << "Options:\n";
    for (const auto& spec : OPTIONS) {
        std::string flags = spec.short_name ? std::string("-") + spec.short_name + ", " : "    ";
        flags += std::string("--") + spec.long_name;
        if (spec.kind != ValueKind::FLAG) {
            flags += " <value>";
        }
        out << "  " << std::left << std::setw(28) << flags << spec.description << "\n";
    }
}

void CommandLine::print_version(std::ostream& out) {
    out << "pqshare 0.1.0\n";
    out << "ML-KEM-768 + X25519 key exchange, ChaCha20-Poly1305 chunks\n";
}

}
