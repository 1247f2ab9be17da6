#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <core/progress/progress_file_writer.h>
#include <cstdio>
#include <memory>
#include <spdlog/spdlog.h>
#include <system_error>

#if defined(_WIN32) || defined(_WIN64)
#include <share.h>
#endif

namespace fs = std::filesystem;

namespace depotprogress::core {

namespace {

using FileHandle = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

// Readers may open the file while it is held for writing.
FileHandle openForOverwrite(const fs::path& path) {
#if defined(_WIN32) || defined(_WIN64)
    std::FILE* file = _wfsopen(path.c_str(), L"wb", _SH_DENYNO);
#else
    std::FILE* file = std::fopen(path.c_str(), "wb");
#endif
    if (file == nullptr) {
        throw std::system_error(errno,
                                std::generic_category(),
                                "cannot open \"" + path.string() + "\"");
    }
    return FileHandle(file, &std::fclose);
}

void writeAll(const fs::path& path, const std::string& payload) {
    auto file = openForOverwrite(path);
    if (std::fwrite(payload.data(), 1, payload.size(), file.get()) != payload.size()) {
        throw std::system_error(errno,
                                std::generic_category(),
                                "short write to \"" + path.string() + "\"");
    }
    std::FILE* raw = file.release();
    if (std::fclose(raw) != 0) {
        throw std::system_error(errno,
                                std::generic_category(),
                                "cannot close \"" + path.string() + "\"");
    }
}

} // namespace

std::string ProgressFileWriter::Serialize(const ProgressSnapshot& snapshot) {
    nlohmann::ordered_json j = snapshot;
    return j.dump();
}

bool ProgressFileWriter::Write(const fs::path& path, const ProgressSnapshot& snapshot) {
    try {
        const std::string payload = Serialize(snapshot);

        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_ == PublishMode::kAtomicRename) {
            writeAtomicRename(path, payload);
        } else {
            writeTruncate(path, payload);
        }
        return true;
    } catch (const std::exception& e) {
        spdlog::debug("Failed to write progress file \"{}\": {}", path.string(), e.what());
        return false;
    }
}

void ProgressFileWriter::writeTruncate(const fs::path& path, const std::string& payload) {
    writeAll(path, payload);
}

void ProgressFileWriter::writeAtomicRename(const fs::path& path, const std::string& payload) {
    static thread_local boost::uuids::random_generator generator;
    fs::path temp_path = path;
    temp_path += "." + boost::uuids::to_string(generator()) + ".tmp";

    try {
        writeAll(temp_path, payload);
        fs::rename(temp_path, path);
    } catch (...) {
        std::error_code ec;
        fs::remove(temp_path, ec);
        throw;
    }
}

} // namespace depotprogress::core
