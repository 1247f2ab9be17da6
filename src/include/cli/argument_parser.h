#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace depotprogress::cli {

struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> log_level;
    bool show_help = false;
    std::optional<std::string> command;
    std::vector<std::string> command_args;
};

class ArgumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);
    explicit ArgumentParser(std::vector<std::string> args);

    // Throws ArgumentError on malformed input.
    CliOptions Parse();

    static std::string HelpText();

private:
    std::vector<std::string> args_;
    std::size_t i; // 当前解析的参数索引

    void parseOptions(const std::string& arg, CliOptions& options);
    void parseCommand(CliOptions& options);

    static void validateOptions(const CliOptions& options);
};

} // namespace depotprogress::cli
