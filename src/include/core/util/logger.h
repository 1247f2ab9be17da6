#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace depotprogress {

// Owns the process logger. stdout carries the OSC progress sequence, so the
// console sink writes to stderr.
class Logger {
    using LoggerType = spdlog::async_logger;

public:
    using Level = spdlog::level::level_enum;
    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::size_t q_max_items = 8192,
           std::size_t thread_count = 1) {
        spdlog::file_event_handlers handlers;
        handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log Start: %s | %s]\n", filename.c_str(), std::ctime(&now));
            }
        };
        handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
            if (fstream) {
                auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
                std::fprintf(fstream, "[Log End: %s | %s]\n\n", filename.c_str(), std::ctime(&now));
            }
        };

        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);

        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, thread_count);
        if (ec) {
            logger_ = std::make_shared<LoggerType>("depotprogress",
                                                   spdlog::sinks_init_list{stderr_sink},
                                                   thread_pool_);
        } else {
            auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                (log_dir / "depotprogress.log").string(), 0, 0, false, 0, handlers);
            logger_ = std::make_shared<LoggerType>("depotprogress",
                                                   spdlog::sinks_init_list{file_sink, stderr_sink},
                                                   thread_pool_);
        }

#ifdef DEPOTPROGRESS_RELEASE
        stderr_sink->set_level(Level::warn);
#endif
        logger_->set_level(level);
        logger_->set_error_handler(
            [](const std::string& msg) { std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str()); });

        stderr_sink->set_pattern("\033[36m[%Y-%m-%d %H:%M:%S.%e] \033[92m[%n] \033[0m%^[%l]%$ %v");
        spdlog::set_default_logger(logger_);
        if (ec) {
            logger_->warn("Log directory \"{}\" unavailable: {}", log_dir.string(), ec.message());
        }
    }
    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    ~Logger() { spdlog::shutdown(); }

    // "warning" is accepted as an alias of spdlog's "warn".
    static Level ParseLevel(std::string_view name) {
        if (name == "warning") {
            return Level::warn;
        }
        return spdlog::level::from_str(std::string(name));
    }

private:
    std::shared_ptr<LoggerType> logger_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
};

} // namespace depotprogress
