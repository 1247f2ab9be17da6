#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>

namespace depotprogress::cli {

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : i(0) {
    for (int k = 1; k < argc; ++k) {
        args_.emplace_back(argv[k]);
    }
}

ArgumentParser::ArgumentParser(std::vector<std::string> args)
    : args_(std::move(args))
    , i(0) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;
    i = 0;

    while (i < args_.size()) {
        const std::string& arg = args_[i];

        if (arg.empty() || arg[0] != '-') {
            // 遇到非选项参数，开始解析命令
            parseCommand(options);
            break;
        }

        parseOptions(arg, options);
        i++;
    }

    validateOptions(options);
    return options;
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-c" || arg == "--config") {
        if (++i >= args_.size()) {
            throw ArgumentError("Missing config path");
        }
        options.config_path = args_[i];
    } else if (arg == "-l" || arg == "--log-level") {
        if (++i >= args_.size()) {
            throw ArgumentError("Missing log level");
        }
        std::string level = args_[i];
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = level;
    } else if (arg == "-h" || arg == "--help") {
        options.show_help = true;
    } else {
        throw ArgumentError("Unknown option: " + arg);
    }
}

void ArgumentParser::parseCommand(CliOptions& options) {
    if (i >= args_.size()) {
        return;
    }

    options.command = args_[i++];

    while (i < args_.size()) {
        options.command_args.push_back(args_[i++]);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level) {
        const std::string& level = *options.log_level;
        if (level != "debug" && level != "info" && level != "warning" && level != "error") {
            throw ArgumentError("Invalid log level: " + *options.log_level);
        }
    }

    if (!options.show_help && !options.command) {
        throw ArgumentError("Missing command");
    }
}

std::string ArgumentParser::HelpText() {
    return "Usage: depotprogress [options] <command> [args...]\n\n"
           "Options:\n"
           "  -c, --config PATH      Set settings file path\n"
           "  -l, --log-level LVL    Set log level (debug|info|warning|error)\n"
           "  -h, --help             Show this help message\n\n"
           "Commands:\n"
           "  report DOWNLOADED TOTAL                    Report byte progress\n"
           "  state STATE [PERCENT [DOWNLOADED TOTAL]]   Report an explicit state\n"
           "                                             (hidden|default|error|indeterminate|warning)\n"
           "  simulate [TOTAL [CHUNK [DELAY_MS]]]        Report a simulated download\n"
           "  watch [FILE]                               Follow a progress file\n\n"
           "Environment:\n"
           "  DEPOTDOWNLOADER_PROGRESS_FILE              Also write progress as JSON to this file\n";
}

} // namespace depotprogress::cli
