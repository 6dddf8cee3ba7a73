#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "../utils/logging.h"

namespace figfuzz::harness {

// Creates the directory when missing, then removes every regular file in it.
// Anything that is not a regular file (subdirectory, socket, symlink to a
// directory, ...) stops the run: the caller treats it as a precondition
// violation. Nothing is removed when such an entry is present.
inline bool prepare_scratch_directory(const std::string& dir, std::string* err = nullptr, uint64_t* removed = nullptr) {
    namespace fs = std::filesystem;
    std::error_code ec;

    if (dir.empty()) {
        if (err != nullptr) *err = "scratch directory path is empty";
        return false;
    }

    if (!fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            if (err != nullptr) *err = "cannot create scratch directory " + dir + ": " + ec.message();
            return false;
        }
    } else if (!fs::is_directory(dir, ec)) {
        if (err != nullptr) *err = "scratch path is not a directory: " + dir;
        return false;
    }

    std::vector<fs::path> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        std::error_code sec;
        if (!entry.is_regular_file(sec) || entry.is_symlink(sec)) {
            if (err != nullptr) *err = "scratch directory holds a non-regular entry: " + entry.path().string();
            log_error("scratch", "non-regular entry " + entry.path().string());
            return false;
        }
        files.push_back(entry.path());
    }
    if (ec) {
        if (err != nullptr) *err = "cannot list scratch directory " + dir + ": " + ec.message();
        return false;
    }

    uint64_t count = 0;
    for (const fs::path& p : files) {
        if (!fs::remove(p, ec) || ec) {
            if (err != nullptr) *err = "cannot remove " + p.string() + ": " + ec.message();
            return false;
        }
        ++count;
    }
    if (removed != nullptr) *removed = count;
    log_info("scratch", "prepared " + dir + " removed=" + std::to_string(count));
    return true;
}

} // namespace figfuzz::harness
