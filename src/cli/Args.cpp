#include "cli/Args.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <stdexcept>

using namespace pith::cli;

namespace {

const std::vector<std::string> COMMANDS = {"build", "status", "watch"};

std::string takeValue(const std::vector<std::string>& argv, size_t& i) {
    if (i + 1 >= argv.size()) throw std::invalid_argument(fmt::format("Option {} requires a value", argv[i]));
    return argv[++i];
}

// Accumulates --ignore patterns, keeping a pattern given earlier through
// --set ignore=... as the first element.
void appendIgnore(YAML::Node& attributes, const std::string& pattern) {
    const YAML::Node current = attributes["ignore"];

    if (current.IsScalar()) {
        YAML::Node patterns(YAML::NodeType::Sequence);
        patterns.push_back(current.Scalar());
        attributes["ignore"] = patterns;
    } else if (current.IsMap()) {
        throw std::invalid_argument("--ignore cannot extend a mapping set through --set ignore=...");
    }

    attributes["ignore"].push_back(pattern);
}

YAML::Node parseValue(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::Exception&) {
        return YAML::Node(text);
    }
}

}

Args pith::cli::parseArgs(const std::vector<std::string>& argv) {
    Args args;
    std::vector<std::string> positionals;

    for (size_t i = 0; i < argv.size(); ++i) {
        const auto& arg = argv[i];

        if (arg == "-h" || arg == "--help") args.help = true;
        else if (arg == "-o" || arg == "--output") args.output = takeValue(argv, i);
        else if (arg == "-c" || arg == "--config") args.config = takeValue(argv, i);
        else if (arg == "--json") args.json = true;
        else if (arg == "--interval") {
            const auto value = takeValue(argv, i);
            long seconds = 0;
            try {
                size_t used = 0;
                seconds = std::stol(value, &used);
                if (used != value.size()) throw std::invalid_argument(value);
            } catch (const std::exception&) {
                throw std::invalid_argument(fmt::format("--interval expects whole seconds, got '{}'", value));
            }
            if (seconds <= 0) throw std::invalid_argument("--interval must be positive");
            args.interval = std::chrono::seconds(seconds);
        } else if (arg == "--ignore") appendIgnore(args.attributes, takeValue(argv, i));
        else if (arg == "--set") {
            const auto kv = takeValue(argv, i);
            const auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0)
                throw std::invalid_argument(fmt::format("--set expects key=value, got '{}'", kv));
            args.attributes[kv.substr(0, eq)] = parseValue(kv.substr(eq + 1));
        } else if (arg.starts_with("-") && arg.size() > 1) throw std::invalid_argument(fmt::format("Unknown option {}", arg));
        else positionals.push_back(arg);
    }

    if (args.help) return args;

    if (positionals.size() != 2)
        throw std::invalid_argument("Expected a command and a source directory");

    args.command = positionals[0];
    if (std::ranges::find(COMMANDS, args.command) == COMMANDS.end())
        throw std::invalid_argument(fmt::format("Unknown command '{}'", args.command));
    args.source = positionals[1];

    if (args.json && args.command != "status") throw std::invalid_argument("--json only applies to status");
    if (args.interval && args.command != "watch") throw std::invalid_argument("--interval only applies to watch");

    return args;
}

std::string pith::cli::usage() {
    return "Usage: pith <build|status|watch> <source_root> [options]\n"
           "\n"
           "Options:\n"
           "  -o, --output DIR      output root (default: <source_root>/_out)\n"
           "  -c, --config FILE     tool configuration (logging, watch interval)\n"
           "      --ignore PATTERN  extra ignore glob (repeatable)\n"
           "      --set KEY=VALUE   project attribute, e.g. assume_directory_index=true\n"
           "      --interval SECS   sync period for watch\n"
           "      --json            machine-readable status\n"
           "  -h, --help            show this help\n";
}
