#pragma once

#include <atomic>
#include <chrono>
#include <core/constant/progress.h>
#include <core/model/progress_snapshot.h>
#include <filesystem>
#include <functional>
#include <optional>

namespace depotprogress::core {

class ProgressWatcher {
public:
    using ChangeCallback = std::function<void(const ProgressSnapshot&)>;

    explicit ProgressWatcher(std::filesystem::path path,
                             std::chrono::milliseconds poll_interval = progress::kDefaultPollInterval)
        : path_(std::move(path))
        , poll_interval_(poll_interval) {}

    // nullopt while the file is missing, empty, half written or not JSON.
    std::optional<ProgressSnapshot> Poll() const;

    // Polls until the download reaches 100%, `stop` becomes true or `timeout`
    // elapses. `on_change` fires whenever the percentage changes.
    std::optional<ProgressSnapshot> Run(const ChangeCallback& on_change,
                                        const std::atomic<bool>& stop,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::chrono::milliseconds poll_interval_;
};

} // namespace depotprogress::core
