#pragma once

#include "pqshare/core/config.hpp"
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pqshare::core {

// One parsed invocation: `pqshare [options] <command> [args...]`
struct Invocation {
    bool show_help = false;
    bool show_version = false;
    bool verbose = false;
    std::string config_file = "pqshare.conf";
    // Configuration key -> value, applied over the loaded file
    std::map<std::string, std::string> overrides;
    // Command name first, as the command handlers expect
    std::vector<std::string> args;

    const std::string& command() const;
};

class CommandLine {
public:
    // Options are checked against the same rules the configuration applies,
    // so a bad --mode is rejected here instead of silently falling back.
    static std::optional<Invocation> parse(const std::vector<std::string>& argv, std::string& error);
    static std::optional<Invocation> parse(int argc, char* argv[], std::string& error);

    static void apply(const Invocation& invocation, Config& config);

    static void print_usage(std::ostream& out);
    static void print_version(std::ostream& out);
};

}
