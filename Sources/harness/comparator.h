// ============================================================================
// FIGSEARCH FUZZ - OUTPUT COMPARATOR
// Module: comparator.h
// Description: tri-state classification of the searcher's stdout against
//              the expected answer. Both sides are trimmed first.
//                exact match                  -> Pass
//                expected is a proper substring -> NeedsReview
//                anything else                -> Fail
// ============================================================================

#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace figfuzz::harness {

enum class Verdict : uint8_t {
    Pass = 0,
    Fail,
    NeedsReview,
};

inline const char* to_string(Verdict v) {
    switch (v) {
        case Verdict::Pass: return "PASS";
        case Verdict::Fail: return "FAIL";
        case Verdict::NeedsReview: return "UNCERTAIN";
    }
    return "FAIL";
}

inline std::string_view trim_view(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
    return s.substr(b, e - b);
}

inline std::string trim(std::string_view s) {
    return std::string(trim_view(s));
}

inline Verdict compare_output(std::string_view actual, std::string_view expected) {
    const std::string_view a = trim_view(actual);
    const std::string_view e = trim_view(expected);
    if (a == e) {
        return Verdict::Pass;
    }
    if (!e.empty() && a.find(e) != std::string_view::npos) {
        return Verdict::NeedsReview;
    }
    return Verdict::Fail;
}

} // namespace figfuzz::harness
