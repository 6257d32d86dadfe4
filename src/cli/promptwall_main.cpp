// =============================================================================
// promptwall_main.cpp - command-line front end
// =============================================================================
// USAGE:
//   promptwall [--config FILE] [--role system|user|tool]
//              [--channel input|memory|instruction] [--json] [PROMPT...]
//
// No PROMPT arguments -> prompt is read from stdin.
//
// EXIT CODES:
//   0 allow   1 warn   2 block   3 quarantine
//   64 usage error     78 configuration error
// =============================================================================
#include "promptwall/config/ConfigError.hpp"
#include "promptwall/config/FirewallConfig.hpp"
#include "promptwall/firewall/Firewall.hpp"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace promptwall;

namespace {

constexpr int EXIT_USAGE  = 64;
constexpr int EXIT_CONFIG = 78;

struct CliOptions {
    std::string configPath;
    Context context;
    bool json = false;
    std::vector<std::string> words;
};

void printUsage(std::ostream& os) {
    os << "usage: promptwall [--config FILE] [--role system|user|tool]\n"
          "                  [--channel input|memory|instruction] [--json] [PROMPT...]\n";
}

// false on a usage error, message already printed
bool parseArgs(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout);
            std::exit(0);
        }
        if (arg == "--json") {
            opts.json = true;
            continue;
        }
        if (arg == "--config" || arg == "--role" || arg == "--channel") {
            if (i + 1 >= argc) {
                std::cerr << "[CLI] " << arg << " needs a value\n";
                return false;
            }
            const std::string value = argv[++i];

            if (arg == "--config") {
                opts.configPath = value;
            } else if (arg == "--role") {
                auto r = parseRole(value);
                if (!r) {
                    std::cerr << "[CLI] unknown role: " << value << "\n";
                    return false;
                }
                opts.context.role = *r;
            } else {
                auto c = parseChannel(value);
                if (!c) {
                    std::cerr << "[CLI] unknown channel: " << value << "\n";
                    return false;
                }
                opts.context.channel = *c;
            }
            continue;
        }
        if (arg == "--") {
            for (++i; i < argc; ++i) opts.words.emplace_back(argv[i]);
            break;
        }
        if (arg.size() > 1 && arg[0] == '-' && arg[1] == '-') {
            std::cerr << "[CLI] unknown option: " << arg << "\n";
            return false;
        }
        opts.words.push_back(arg);
    }
    return true;
}

std::string readPrompt(const CliOptions& opts) {
    if (opts.words.empty()) {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::string prompt;
    for (std::size_t i = 0; i < opts.words.size(); ++i) {
        if (i) prompt += ' ';
        prompt += opts.words[i];
    }
    return prompt;
}

int exitCodeFor(PolicyAction action) {
    return static_cast<int>(action);
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parseArgs(argc, argv, opts)) {
        printUsage(std::cerr);
        return EXIT_USAGE;
    }

    auto sink = std::make_shared<StderrSink>();

    try {
        FirewallConfig config = opts.configPath.empty()
            ? FirewallConfig{}
            : loadConfigFromFile(opts.configPath, *sink);
        applyEnvironmentOverrides(config, *sink);

        Firewall firewall(makeDefaultParts(config, sink));
        const Decision decision = firewall.evaluate(readPrompt(opts), opts.context);

        if (opts.json) {
            std::cout << decision.toJsonString(2) << "\n";
        } else {
            decision.print();
            std::cout << decision.explanation << "\n";
        }
        return exitCodeFor(decision.action);

    } catch (const ConfigError& e) {
        std::cerr << e.what() << "\n";
        return EXIT_CONFIG;
    }
}
