#include <core/progress/progress_watcher.h>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>

namespace depotprogress::core {

std::optional<ProgressSnapshot> ProgressWatcher::Poll() const {
    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto j = nlohmann::json::parse(content, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::trace("Progress file \"{}\" not readable yet", path_.string());
        return std::nullopt;
    }

    try {
        return j.get<ProgressSnapshot>();
    } catch (const std::exception& e) {
        spdlog::debug("Unexpected progress file content: {}", e.what());
        return std::nullopt;
    }
}

std::optional<ProgressSnapshot> ProgressWatcher::Run(
    const ChangeCallback& on_change,
    const std::atomic<bool>& stop,
    std::optional<std::chrono::milliseconds> timeout) const {
    const auto deadline = timeout ? std::chrono::steady_clock::now() + *timeout
                                  : std::chrono::steady_clock::time_point::max();
    std::optional<ProgressSnapshot> last;

    while (!stop.load()) {
        if (auto snapshot = Poll()) {
            if (!last || last->percentage != snapshot->percentage) {
                if (on_change) {
                    on_change(*snapshot);
                }
            }
            last = snapshot;
            if (snapshot->percentage >= 100) {
                break;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::debug("Stopped watching \"{}\" after timeout", path_.string());
            break;
        }
        std::this_thread::sleep_for(poll_interval_);
    }

    return last;
}

} // namespace depotprogress::core
