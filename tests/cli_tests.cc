#include <catch2/catch.hpp>

#include "test_support.h"
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <cli/progress_display.h>

namespace cli_tests {

using namespace depotprogress;
using namespace depotprogress::core;
using test::FakeCapabilityDetector;
using test::FakeConsoleHost;
using test::ReadFile;
using test::TempDir;
using test::WriteFile;

cli::CliOptions Parse(std::vector<std::string> args) {
    return cli::ArgumentParser(std::move(args)).Parse();
}

TEST_CASE("Argument parser splits options from the command", "[cli][args]") {
    auto options = Parse({"-c", "settings.toml", "--log-level", "DEBUG", "state", "warning", "40"});
    CHECK(options.config_path == "settings.toml");
    CHECK(options.log_level == "debug");
    REQUIRE(options.command.has_value());
    CHECK(*options.command == "state");
    CHECK(options.command_args == std::vector<std::string>{"warning", "40"});

    CHECK(Parse({"--help"}).show_help);
}

TEST_CASE("Argument parser rejects malformed input", "[cli][args]") {
    CHECK_THROWS_AS(Parse({}), cli::ArgumentError);
    CHECK_THROWS_AS(Parse({"--verbose", "report"}), cli::ArgumentError);
    CHECK_THROWS_AS(Parse({"-c"}), cli::ArgumentError);
    CHECK_THROWS_AS(Parse({"-l", "chatty", "report"}), cli::ArgumentError);
}

TEST_CASE("Counts must be plain unsigned integers", "[cli][args]") {
    CHECK(cli::ParseCount("0", "n") == 0);
    CHECK(cli::ParseCount("18446744073709551615", "n") == UINT64_MAX);
    CHECK_THROWS_AS(cli::ParseCount("-1", "n"), cli::ArgumentError);
    CHECK_THROWS_AS(cli::ParseCount("12x", "n"), cli::ArgumentError);
    CHECK_THROWS_AS(cli::ParseCount("", "n"), cli::ArgumentError);
    CHECK_THROWS_AS(cli::ParseCount("99999999999999999999", "n"), cli::ArgumentError);
}

TEST_CASE("Watch lines show bytes or percent only", "[cli][display]") {
    CHECK(cli::ProgressDisplay::FormatLine({.downloaded = 420, .total = 1000, .percentage = 42})
          == " 42.00%  (420/1000 bytes)");
    CHECK(cli::ProgressDisplay::FormatLine({.downloaded = 0, .total = 0, .percentage = 7})
          == "  7.00%  (percent-only)");
}

struct CliFixture {
    std::shared_ptr<FakeConsoleHost> host = std::make_shared<FakeConsoleHost>();
    TempDir dir;
    std::filesystem::path file = dir / "progress.json";

    CliFixture() { host->env["DEPOTDOWNLOADER_PROGRESS_FILE"] = file.string(); }

    int Run(std::vector<std::string> args, ReporterOptions options = {}) {
        ProgressReporter reporter(host, std::make_shared<FakeCapabilityDetector>(), options);
        cli::CliManager manager(reporter, Settings{});
        return manager.Execute(Parse(std::move(args)));
    }
};

TEST_CASE("report and state commands drive the reporter", "[cli][commands]") {
    CliFixture f;

    CHECK(f.Run({"report", "50", "200"}) == 0);
    CHECK(ReadFile(f.file) == R"({"downloaded":50,"total":200,"percentage":25})");

    f.host->clear();
    CHECK(f.Run({"state", "warning", "40", "4", "10"}) == 0);
    CHECK(ReadFile(f.file) == R"({"downloaded":4,"total":10,"percentage":40})");
    CHECK(f.host->out().find("\x1b]9;4;4;40\x07") != std::string::npos);

    CHECK(f.Run({"state", "hidden"}) == 0);
    CHECK(ReadFile(f.file) == R"({"downloaded":0,"total":0,"percentage":0})");
}

TEST_CASE("Bad command arguments return a usage error", "[cli][commands]") {
    CliFixture f;
    CHECK(f.Run({"report", "50"}) == 1);
    CHECK(f.Run({"state", "paused"}) == 1);
    CHECK(f.Run({"state", "default", "300"}) == 1);
    CHECK(f.Run({"state", "default", "10", "5"}) == 1);
    CHECK(f.Run({"simulate", "10", "0"}) == 1);
    CHECK(f.Run({"download"}) == 1);
    CHECK_FALSE(std::filesystem::exists(f.file));
}

TEST_CASE("simulate reports every chunk and ends complete", "[cli][commands]") {
    CliFixture f;
    CHECK(f.Run({"simulate", "10", "3", "0"}, {.terminal_mode = TerminalMode::kOn}) == 0);

    CHECK(ReadFile(f.file) == R"({"downloaded":10,"total":10,"percentage":100})");
    const auto out = f.host->out();
    CHECK(out.find("\x1b]9;4;3;0\x07") != std::string::npos);
    CHECK(out.find("\x1b]9;4;1;30\x07") != std::string::npos);
    CHECK(out.find("\x1b]9;4;1;90\x07") != std::string::npos);
    CHECK(out.find("\x1b]9;4;1;100\x07") != std::string::npos);
    CHECK(out.ends_with("\x1b]9;4;0;100\x07"));
}

TEST_CASE("Stop request interrupts simulate with a warning", "[cli][commands]") {
    CliFixture f;
    ProgressReporter reporter(f.host,
                              std::make_shared<FakeCapabilityDetector>(),
                              {.terminal_mode = TerminalMode::kOn});
    cli::CliManager manager(reporter, Settings{});
    manager.RequestStop();

    CHECK(manager.Execute(Parse({"simulate", "10", "3", "0"})) == 0);

    CHECK(ReadFile(f.file) == R"({"downloaded":0,"total":10,"percentage":0})");
    CHECK(f.host->out().ends_with("\x1b]9;4;4;0\x07"));
    CHECK(f.host->out().find("\x1b]9;4;0;") == std::string::npos);
}

TEST_CASE("watch returns once the file reports completion", "[cli][commands]") {
    CliFixture f;
    WriteFile(f.file, R"({"downloaded":10,"total":10,"percentage":100})");
    CHECK(f.Run({"watch", f.file.string()}) == 0);
}

} // namespace cli_tests
