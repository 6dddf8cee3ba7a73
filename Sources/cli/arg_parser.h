#pragma once

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "../config/run_config.h"

namespace figfuzz {

struct ParseArgsResult {
    HarnessRunConfig cfg;

    bool show_help = false;
    std::vector<std::string> errors;

    bool ok() const {
        return errors.empty();
    }
};

inline bool parse_i64(const char* s, long long& out) {
    if (s == nullptr) return false;
    char* end = nullptr;
    errno = 0;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || (end != nullptr && *end != '\0') || errno == ERANGE) return false;
    out = v;
    return true;
}

inline bool parse_u64(const char* s, uint64_t& out) {
    if (s == nullptr || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || (end != nullptr && *end != '\0') || errno == ERANGE) return false;
    out = static_cast<uint64_t>(v);
    return true;
}

inline bool parse_i32(const char* s, int& out) {
    long long v = 0;
    if (!parse_i64(s, v) || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

inline bool has_arg(int argc, char** argv, std::string_view flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) return true;
    }
    return false;
}

// Accepts the legacy positional form "<mode> <exec>" as well as flags.
inline ParseArgsResult parse_args(int argc, char** argv) {
    ParseArgsResult r{};
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i] != nullptr ? argv[i] : "");
        auto next = [&](const char*& out) -> bool {
            if (i + 1 >= argc) {
                r.errors.push_back("missing value for " + std::string(a));
                return false;
            }
            out = argv[++i];
            return out != nullptr;
        };
        auto bad_value = [&](const char* v) {
            r.errors.push_back("invalid value for " + std::string(a) + ": " + (v != nullptr ? v : ""));
        };

        const char* v = nullptr;
        if (a == "--help" || a == "-h") { r.show_help = true; continue; }
        if (a == "--mode") {
            if (next(v) && !parse_harness_mode(v, r.cfg.mode)) bad_value(v);
            continue;
        }
        if (a == "--exec") {
            if (next(v)) r.cfg.exec_path = v;
            continue;
        }
        if (a == "--random-validity") { r.cfg.random_validity = true; continue; }
        if (a == "--fuzz-whitespace") { r.cfg.fuzz_whitespace = true; continue; }
        if (a == "--verbose" || a == "-v") { r.cfg.verbose = true; continue; }
        if (a == "--trials") {
            if (next(v) && !parse_u64(v, r.cfg.trials)) bad_value(v);
            continue;
        }
        if (a == "--seed") {
            if (next(v) && !parse_u64(v, r.cfg.seed)) bad_value(v);
            continue;
        }
        if (a == "--width") {
            if (next(v) && (!parse_i32(v, r.cfg.width) || r.cfg.width < 0)) bad_value(v);
            continue;
        }
        if (a == "--height") {
            if (next(v) && (!parse_i32(v, r.cfg.height) || r.cfg.height < 0)) bad_value(v);
            continue;
        }
        if (a == "--max-dim") {
            if (next(v) && (!parse_i32(v, r.cfg.max_dim) || r.cfg.max_dim < 1)) bad_value(v);
            continue;
        }
        if (a == "--queries") {
            if (next(v) && !parse_query_list(v, r.cfg.queries)) bad_value(v);
            continue;
        }
        if (a == "--scratch-dir") {
            if (next(v)) r.cfg.scratch_dir = v;
            continue;
        }
        if (a == "--timeout-ms") {
            long long t = 0;
            if (next(v)) {
                if (!parse_i64(v, t) || t < 0) bad_value(v);
                else r.cfg.timeout_ms = static_cast<int64_t>(t);
            }
            continue;
        }
        if (a == "--interactive") { r.cfg.review = ReviewPolicy::Interactive; continue; }
        if (a == "--unattended") { r.cfg.review = ReviewPolicy::Unattended; continue; }
        if (a == "--check-wire-order") { r.cfg.check_wire_order = true; continue; }

        if (!a.empty() && a[0] == '-') {
            r.errors.push_back("unknown option: " + std::string(a));
            continue;
        }
        positional.emplace_back(a);
    }

    if (positional.size() == 1) {
        if (r.cfg.exec_path.empty()) r.cfg.exec_path = positional[0];
        else r.errors.push_back("unexpected argument: " + positional[0]);
    } else if (positional.size() == 2) {
        if (!parse_harness_mode(positional[0], r.cfg.mode)) {
            r.errors.push_back("invalid mode: " + positional[0]);
        }
        r.cfg.exec_path = positional[1];
    } else if (positional.size() > 2) {
        r.errors.push_back("invalid number of arguments");
    }

    if (!r.show_help && r.cfg.exec_path.empty()) {
        r.errors.push_back("missing path to the program under test (--exec)");
    }
    if (r.cfg.trials == 0) {
        r.errors.push_back("--trials must be at least 1");
    }
    if ((r.cfg.width > 0) != (r.cfg.height > 0)) {
        r.errors.push_back("--width and --height must be given together");
    }

    return r;
}

} // namespace figfuzz
