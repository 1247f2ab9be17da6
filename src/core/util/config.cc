#include <core/constant/path.h>
#include <core/util/config.h>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>

namespace depotprogress::core {

namespace {

std::string_view terminalModeName(TerminalMode mode) {
    switch (mode) {
    case TerminalMode::kOn:
        return "on";
    case TerminalMode::kOff:
        return "off";
    case TerminalMode::kAuto:
    default:
        return "auto";
    }
}

TerminalMode parseTerminalMode(std::string_view value) {
    if (value == "on") {
        return TerminalMode::kOn;
    } else if (value == "off") {
        return TerminalMode::kOff;
    } else if (value != "auto") {
        spdlog::warn("Unknown progress.terminal value \"{}\", using auto", value);
    }
    return TerminalMode::kAuto;
}

bool isValidLogLevel(std::string_view level) {
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

} // namespace

std::filesystem::path DefaultSettingsPath() {
    return path::kConfigDir / "config.toml";
}

Settings SettingsFromTable(const toml::table& table) {
    Settings settings;

    if (auto progress_section = table["progress"].as_table()) {
        auto& section = *progress_section;
        settings.reporter.terminal_mode = parseTerminalMode(
            section["terminal"].value_or(std::string("auto")));
        settings.reporter.publish_mode = section["atomic-write"].value_or(false)
                                             ? PublishMode::kAtomicRename
                                             : PublishMode::kTruncate;
    }

    if (auto watch = table["watch"].as_table()) {
        auto interval = (*watch)["poll-interval-ms"].value_or(
            static_cast<int64_t>(progress::kDefaultPollInterval.count()));
        if (interval > 0) {
            settings.poll_interval = std::chrono::milliseconds(interval);
        } else {
            spdlog::warn("watch.poll-interval-ms must be positive, got {}", interval);
        }
    }

    if (auto log = table["log"].as_table()) {
        std::string level = (*log)["level"].value_or(settings.log_level);
        if (isValidLogLevel(level)) {
            settings.log_level = level;
        } else {
            spdlog::warn("Unknown log.level \"{}\", using {}", level, settings.log_level);
        }
    }

    return settings;
}

Settings ParseSettings(std::string_view toml_text) {
    try {
        return SettingsFromTable(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        spdlog::error("Invalid settings: {}", err.description());
        return Settings{};
    }
}

Settings LoadSettings(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::debug("Settings file \"{}\" does not exist, using defaults", path.string());
        return Settings{};
    }
    try {
        return SettingsFromTable(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        return Settings{};
    }
}

toml::table SettingsToTable(const Settings& settings) {
    return toml::table{
        {"progress",
         toml::table{
             {"terminal", std::string(terminalModeName(settings.reporter.terminal_mode))},
             {"atomic-write", settings.reporter.publish_mode == PublishMode::kAtomicRename},
         }},
        {"watch",
         toml::table{
             {"poll-interval-ms", static_cast<int64_t>(settings.poll_interval.count())},
         }},
        {"log",
         toml::table{
             {"level", settings.log_level},
         }},
    };
}

bool SaveSettings(const std::filesystem::path& path, const Settings& settings) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving settings.", path.string());
        return false;
    }
    ofs << SettingsToTable(settings) << '\n';
    return ofs.good();
}

Settings InitSettings(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        return LoadSettings(path);
    }

    spdlog::info("Settings file \"{}\" does not exist, creating...", path.string());
    Settings settings;
    if (!SaveSettings(path, settings)) {
        spdlog::warn("Continuing with default settings");
    }
    return settings;
}

} // namespace depotprogress::core
