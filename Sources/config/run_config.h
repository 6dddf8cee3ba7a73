//Author copyright Marcin Matysek (Rewertyn)
#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../core/geometry.h"

namespace figfuzz {

enum class QueryKind : uint8_t {
    Test = 0,
    HLine,
    VLine,
    Square,
};

inline constexpr std::array<QueryKind, 4> kAllQueries = {
    QueryKind::Test,
    QueryKind::HLine,
    QueryKind::VLine,
    QueryKind::Square,
};

enum class HarnessMode : uint8_t {
    Functional = 0,
    Timed,
};

enum class ReviewPolicy : uint8_t {
    Auto = 0,      // interactive when stdin and stdout are terminals
    Interactive,
    Unattended,
};

enum class HarnessError : uint8_t {
    None = 0,
    PreconditionViolation,
    ProcessFailure,
    OutputMismatch,
};

inline constexpr BitmapSize kTimedDefaultSize{1920, 1080};

struct HarnessRunConfig {
    HarnessMode mode = HarnessMode::Functional;
    std::string exec_path;

    bool random_validity = false;
    bool fuzz_whitespace = false;
    bool verbose = false;

    uint64_t trials = 10;
    uint64_t seed = 0;

    // 0 = random per trial in [1, max_dim]; timed mode falls back to kTimedDefaultSize.
    int width = 0;
    int height = 0;
    int max_dim = 64;

    std::vector<QueryKind> queries = {kAllQueries.begin(), kAllQueries.end()};

    std::string scratch_dir = "pics";
    int64_t timeout_ms = -1;   // -1 = env/default fallback, 0 = no limit
    ReviewPolicy review = ReviewPolicy::Auto;

    bool check_wire_order = false;
};

inline std::string normalize_token(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (const unsigned char ch : in) {
        if (std::isalnum(ch) != 0) {
            out.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return out;
}

inline const char* to_string(QueryKind q) {
    switch (q) {
        case QueryKind::Test: return "test";
        case QueryKind::HLine: return "hline";
        case QueryKind::VLine: return "vline";
        case QueryKind::Square: return "square";
    }
    return "test";
}

inline const char* to_string(HarnessMode m) {
    switch (m) {
        case HarnessMode::Functional: return "functional";
        case HarnessMode::Timed: return "timed";
    }
    return "functional";
}

inline const char* to_string(HarnessError e) {
    switch (e) {
        case HarnessError::None: return "none";
        case HarnessError::PreconditionViolation: return "precondition_violation";
        case HarnessError::ProcessFailure: return "process_failure";
        case HarnessError::OutputMismatch: return "output_mismatch";
    }
    return "none";
}

inline bool parse_query_kind(std::string_view raw, QueryKind& out) {
    const std::string key = normalize_token(raw);
    static const std::array<std::pair<std::string_view, QueryKind>, 4> map = {{
        {"test", QueryKind::Test},
        {"hline", QueryKind::HLine},
        {"vline", QueryKind::VLine},
        {"square", QueryKind::Square},
    }};
    for (const auto& [name, kind] : map) {
        if (key == name) {
            out = kind;
            return true;
        }
    }
    return false;
}

// Also accepts the short legacy spellings "time" and "functionality".
inline bool parse_harness_mode(std::string_view raw, HarnessMode& out) {
    const std::string key = normalize_token(raw);
    if (key == "functional" || key == "functionality") {
        out = HarnessMode::Functional;
        return true;
    }
    if (key == "timed" || key == "time") {
        out = HarnessMode::Timed;
        return true;
    }
    return false;
}

// Comma separated list, duplicates dropped, order kept.
inline bool parse_query_list(std::string_view raw, std::vector<QueryKind>& out) {
    std::vector<QueryKind> parsed;
    size_t start = 0;
    while (start <= raw.size()) {
        const size_t comma = raw.find(',', start);
        const std::string_view token = raw.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        QueryKind q{};
        if (!parse_query_kind(token, q)) {
            return false;
        }
        bool seen = false;
        for (QueryKind p : parsed) seen = seen || p == q;
        if (!seen) parsed.push_back(q);
        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    if (parsed.empty()) {
        return false;
    }
    out = std::move(parsed);
    return true;
}

inline BitmapSize configured_size(const HarnessRunConfig& cfg) {
    if (cfg.width > 0 && cfg.height > 0) {
        return BitmapSize{cfg.width, cfg.height};
    }
    if (cfg.mode == HarnessMode::Timed) {
        return kTimedDefaultSize;
    }
    return BitmapSize{0, 0};
}

} // namespace figfuzz
