#pragma once

#include <core/model/progress_snapshot.h>
#include <core/model/reporter_config.h>
#include <filesystem>
#include <mutex>
#include <string>

namespace depotprogress::core {

class ProgressFileWriter {
public:
    explicit ProgressFileWriter(PublishMode mode = PublishMode::kTruncate)
        : mode_(mode) {}

    ProgressFileWriter(const ProgressFileWriter&) = delete;
    ProgressFileWriter& operator=(const ProgressFileWriter&) = delete;

    // Replaces the file content with the compact JSON snapshot.
    // Never throws; returns false if the file could not be written.
    bool Write(const std::filesystem::path& path, const ProgressSnapshot& snapshot);

    static std::string Serialize(const ProgressSnapshot& snapshot);

    [[nodiscard]] PublishMode mode() const { return mode_; }

private:
    void writeTruncate(const std::filesystem::path& path, const std::string& payload);
    void writeAtomicRename(const std::filesystem::path& path, const std::string& payload);

    PublishMode mode_;
    std::mutex mutex_;
};

} // namespace depotprogress::core
