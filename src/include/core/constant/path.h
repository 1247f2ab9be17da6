#pragma once

#include <cstdlib>
#include <filesystem>

namespace depotprogress::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path()
                                             / "DepotProgress" / "logs";

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* base = std::getenv("APPDATA");
    return base ? std::filesystem::path(base) / "DepotProgress"
                : std::filesystem::temp_directory_path() / "DepotProgress";
#else
    const char* base = std::getenv("HOME");
    return base ? std::filesystem::path(base) / ".config" / "DepotProgress"
                : std::filesystem::temp_directory_path() / "DepotProgress";
#endif
}();

} // namespace path
} // namespace depotprogress::core
