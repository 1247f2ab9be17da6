#include <atomic>
#include <cli/argument_parser.h>
#include <cli/cli_manager.h>
#include <cli/terminal.h>
#include <core/constant/path.h>
#include <core/progress/progress_reporter.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <core/util/system.h>
#include <csignal>
#include <iostream>
#include <memory>

namespace {

std::atomic<depotprogress::cli::CliManager*> active_manager{nullptr};

void onInterrupt(int) {
    if (auto* manager = active_manager.load()) {
        manager->RequestStop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace depotprogress;

    cli::CliOptions options;
    try {
        cli::ArgumentParser parser(argc, argv);
        options = parser.Parse();
    } catch (const cli::ArgumentError& e) {
        cli::Terminal terminal;
        terminal.PrintError(e.what());
        std::cerr << cli::ArgumentParser::HelpText();
        return 1;
    }

    Logger logger(Logger::ParseLevel(options.log_level.value_or("info")), core::path::kLogDir);

    const auto settings_path = options.config_path ? std::filesystem::path(*options.config_path)
                                                   : core::DefaultSettingsPath();
    auto settings = core::InitSettings(settings_path);
    if (!options.log_level) {
        logger.set_log_level(Logger::ParseLevel(settings.log_level));
    }

    core::ProgressReporter reporter(std::make_shared<core::SystemConsoleHost>(),
                                    std::make_shared<core::PlatformCapabilityDetector>(),
                                    settings.reporter);

    cli::CliManager manager(reporter, std::move(settings));
    active_manager.store(&manager);
    std::signal(SIGINT, onInterrupt);

    int code = manager.Execute(options);
    active_manager.store(nullptr);
    return code;
}
