/*
    config.h
    Application settings stored in a TOML file.

    Example config.toml:

        [progress]
        terminal = "auto"      # auto | on | off
        atomic-write = false   # publish the progress file via temp file + rename

        [watch]
        poll-interval-ms = 100

        [log]
        level = "info"         # debug | info | warning | error

    Usage:
        auto settings = depotprogress::core::InitSettings(path);
        settings.reporter.terminal_mode = TerminalMode::kOff;
        depotprogress::core::SaveSettings(path, settings);

    The progress file path itself is only taken from the environment.
*/

#pragma once

#include <chrono>
#include <core/constant/progress.h>
#include <core/model/reporter_config.h>
#include <filesystem>
#include <string>
#include <string_view>
#include <toml++/toml.h>

namespace depotprogress::core {

struct Settings {
    ReporterOptions reporter;
    std::chrono::milliseconds poll_interval = progress::kDefaultPollInterval;
    std::string log_level = "info";
};

std::filesystem::path DefaultSettingsPath();

// Missing or unparsable files yield defaults.
Settings LoadSettings(const std::filesystem::path& path);
Settings ParseSettings(std::string_view toml_text);
Settings SettingsFromTable(const toml::table& table);

// Loads settings, writing the defaults to `path` when no file exists yet.
Settings InitSettings(const std::filesystem::path& path);

toml::table SettingsToTable(const Settings& settings);
bool SaveSettings(const std::filesystem::path& path, const Settings& settings);

} // namespace depotprogress::core
