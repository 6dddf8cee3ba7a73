// ============================================================================
// FIGFUZZ - RUN LOG
// Module: logging.h
// Description: one append-only log per harness process. Every line carries
//              the seed of the current run, so a failing trial in the log
//              can be replayed with --seed.
//              File: figfuzz_<date>_<time>_<pid>.log in FIGFUZZ_LOG_DIR,
//              or the working directory when the variable is unset.
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

#include <unistd.h>

namespace figfuzz {

enum class LogLevel {
    Info,
    Warn,
    Error
};

inline const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

inline std::tm local_time_now() {
    const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

inline std::filesystem::path log_directory() {
    const char* dir = std::getenv("FIGFUZZ_LOG_DIR");
    if (dir != nullptr && *dir != '\0') {
        return dir;
    }
    std::error_code ec;
    const std::filesystem::path cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path{} : cwd;
}

class RunLog {
public:
    RunLog() {
        const std::tm tm = local_time_now();
        std::ostringstream name;
        name << "figfuzz_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << "_" << ::getpid() << ".log";
        path_ = (log_directory() / name.str()).string();
        stream_.open(path_, std::ios::out | std::ios::app);
    }

    const std::string& path() const {
        return path_;
    }

    bool is_open() const {
        return stream_.is_open();
    }

    // 0 until a run starts; lines written before that show "seed=-".
    void set_run_seed(uint64_t seed) {
        std::lock_guard<std::mutex> lock(mu_);
        seed_ = seed;
    }

    uint64_t run_seed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return seed_;
    }

    uint64_t lines_written() const {
        std::lock_guard<std::mutex> lock(mu_);
        return lines_;
    }

    void write(LogLevel level, const std::string& scope, const std::string& msg) {
        std::lock_guard<std::mutex> lock(mu_);
        if (!stream_) {
            return;
        }
        const std::tm tm = local_time_now();
        stream_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
                << " [" << level_name(level) << "]"
                << " seed=" << (seed_ != 0 ? std::to_string(seed_) : std::string("-"))
                << " (" << scope << ") "
                << msg << "\n";
        stream_.flush();
        ++lines_;
    }

private:
    std::string path_;
    std::ofstream stream_;
    uint64_t seed_ = 0;
    uint64_t lines_ = 0;
    mutable std::mutex mu_;
};

inline RunLog& run_log() {
    static RunLog log;
    return log;
}

inline void log_info(const std::string& scope, const std::string& msg) {
    run_log().write(LogLevel::Info, scope, msg);
}

inline void log_warn(const std::string& scope, const std::string& msg) {
    run_log().write(LogLevel::Warn, scope, msg);
}

inline void log_error(const std::string& scope, const std::string& msg) {
    run_log().write(LogLevel::Error, scope, msg);
}

} // namespace figfuzz
