#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace depotprogress::core {

struct ProgressSnapshot {
    std::uint64_t downloaded = 0;
    std::uint64_t total = 0;
    std::uint8_t percentage = 0;

    bool operator==(const ProgressSnapshot&) const = default;
};

// Key order is part of the file format, so the writer side uses ordered_json.
inline void to_json(nlohmann::ordered_json& j, const ProgressSnapshot& snapshot) {
    j = nlohmann::ordered_json{
        {"downloaded", snapshot.downloaded},
        {"total", snapshot.total},
        {"percentage", snapshot.percentage},
    };
}

inline void from_json(const nlohmann::json& j, ProgressSnapshot& snapshot) {
    snapshot.downloaded = j.value("downloaded", std::uint64_t{0});
    snapshot.total = j.value("total", std::uint64_t{0});
    auto percentage = j.value("percentage", std::int64_t{0});
    if (percentage < 0 || percentage > 255) {
        throw std::out_of_range("percentage out of range: " + std::to_string(percentage));
    }
    snapshot.percentage = static_cast<std::uint8_t>(percentage);
}

} // namespace depotprogress::core
