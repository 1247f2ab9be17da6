#include <algorithm>
#include <chrono>
#include <cli/cli_manager.h>
#include <core/constant/progress.h>
#include <core/progress/progress_watcher.h>
#include <cstdlib>
#include <spdlog/spdlog.h>
#include <thread>

using namespace depotprogress::core;

namespace depotprogress::cli {

namespace {

constexpr std::uint64_t kDefaultSimulatedTotal = 100 * 1024 * 1024; // 100 MB
constexpr std::uint64_t kDefaultSimulatedChunk = 1 * 1024 * 1024;   // 1 MB
constexpr std::uint64_t kDefaultSimulatedDelayMs = 20;

} // namespace

std::uint64_t ParseCount(const std::string& text, const char* what) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw ArgumentError(std::string("Invalid ") + what + ": " + text);
    }
    try {
        std::size_t consumed = 0;
        auto value = std::stoull(text, &consumed);
        if (consumed != text.size()) {
            throw ArgumentError(std::string("Invalid ") + what + ": " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ArgumentError(std::string("Invalid ") + what + ": " + text);
    }
}

CliManager::CliManager(ProgressReporter& reporter, Settings settings)
    : reporter_(reporter)
    , settings_(std::move(settings))
    , terminal_(std::make_unique<Terminal>())
    , progress_display_(std::make_unique<ProgressDisplay>()) {}

CliManager::~CliManager() = default;

int CliManager::Execute(const CliOptions& options) {
    if (options.show_help || !options.command || *options.command == "help") {
        terminal_->PrintLine(ArgumentParser::HelpText());
        return 0;
    }

    const auto& command = *options.command;
    const auto& args = options.command_args;
    try {
        if (command == "report") {
            handleReport(args);
        } else if (command == "state") {
            handleState(args);
        } else if (command == "simulate") {
            handleSimulate(args);
        } else if (command == "watch") {
            return handleWatch(args);
        } else {
            throw ArgumentError("Unknown command: " + command);
        }
    } catch (const ArgumentError& e) {
        terminal_->PrintError(e.what());
        terminal_->PrintLine(ArgumentParser::HelpText());
        return 1;
    }
    return 0;
}

void CliManager::handleReport(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        throw ArgumentError("report expects DOWNLOADED TOTAL");
    }
    reporter_.Initialize();
    reporter_.Report(ParseCount(args[0], "downloaded"), ParseCount(args[1], "total"));
}

void CliManager::handleState(const std::vector<std::string>& args) {
    if (args.empty() || args.size() == 3 || args.size() > 4) {
        throw ArgumentError("state expects STATE [PERCENT [DOWNLOADED TOTAL]]");
    }
    auto state = ParseProgressState(args[0]);
    if (!state) {
        throw ArgumentError("Unknown state: " + args[0]);
    }

    std::uint64_t percent = 0;
    if (args.size() >= 2) {
        percent = ParseCount(args[1], "percent");
        if (percent > progress::kMaxPercentage) {
            throw ArgumentError("Percent out of range: " + args[1]);
        }
    }
    std::uint64_t downloaded = args.size() == 4 ? ParseCount(args[2], "downloaded") : 0;
    std::uint64_t total = args.size() == 4 ? ParseCount(args[3], "total") : 0;

    reporter_.Initialize();
    reporter_.Report(*state, static_cast<std::uint8_t>(percent), downloaded, total);
}

void CliManager::handleSimulate(const std::vector<std::string>& args) {
    if (args.size() > 3) {
        throw ArgumentError("simulate expects [TOTAL [CHUNK [DELAY_MS]]]");
    }
    const std::uint64_t total = args.size() > 0 ? ParseCount(args[0], "total")
                                                 : kDefaultSimulatedTotal;
    const std::uint64_t chunk = args.size() > 1 ? ParseCount(args[1], "chunk")
                                                : kDefaultSimulatedChunk;
    const std::uint64_t delay_ms = args.size() > 2 ? ParseCount(args[2], "delay")
                                                   : kDefaultSimulatedDelayMs;
    if (chunk == 0) {
        throw ArgumentError("Chunk size must be positive");
    }

    reporter_.Initialize();
    spdlog::info("Simulating download of {} bytes in {} byte chunks", total, chunk);

    reporter_.Report(ProgressState::kIndeterminate);
    std::uint64_t downloaded = 0;
    reporter_.Report(downloaded, total);
    while (downloaded < total && !stop_requested_.load()) {
        downloaded += std::min(chunk, total - downloaded);
        reporter_.Report(downloaded, total);
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
    }

    if (downloaded < total) {
        spdlog::warn("Simulation interrupted at {}/{} bytes", downloaded, total);
        reporter_.Report(ProgressState::kWarning,
                         ProgressReporter::ComputePercentage(downloaded, total),
                         downloaded,
                         total);
        return;
    }
    // Hidden clears the taskbar indicator; the file keeps the final 100%.
    reporter_.Report(ProgressState::kHidden, 100, downloaded, total);
}

int CliManager::handleWatch(const std::vector<std::string>& args) {
    if (args.size() > 1) {
        throw ArgumentError("watch expects [FILE]");
    }

    std::filesystem::path file;
    if (!args.empty()) {
        file = args[0];
    } else if (const char* env = std::getenv(std::string(progress::kProgressFileEnv).c_str());
               env != nullptr && *env != '\0') {
        file = env;
    } else {
        throw ArgumentError("watch needs FILE or " + std::string(progress::kProgressFileEnv));
    }

    terminal_->PrintInfo("Watching " + file.string());
    ProgressWatcher watcher(file, settings_.poll_interval);
    auto last = watcher.Run(
        [this](const ProgressSnapshot& snapshot) { progress_display_->UpdateProgress(snapshot); },
        stop_requested_);

    if (last && last->percentage >= 100) {
        progress_display_->Complete();
        return 0;
    }
    spdlog::info("Stopped watching before completion");
    return 0;
}

} // namespace depotprogress::cli
