#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

#include <unistd.h>

#include "../config/run_config.h"
#include "../utils/logging.h"
#include "comparator.h"

namespace figfuzz::harness {

struct TrialOutcome {
    uint64_t trial = 0;
    QueryKind query = QueryKind::Test;
    std::string fixture_path;
    std::string expected;
    std::string actual;
    Verdict verdict = Verdict::Fail;
    HarnessError error = HarnessError::None;
    std::string process_note;   // set when the process itself misbehaved
    double elapsed_ms = 0.0;

    bool reviewed = false;
    bool accepted = false;      // final decision after review

    bool passed() const {
        return verdict == Verdict::Pass || (verdict == Verdict::NeedsReview && accepted);
    }
};

// Uncertain matches and failures always go through these hooks, so an
// automated run never turns a fuzzy match into a silent pass.
struct ReviewHooks {
    std::function<bool(const TrialOutcome&)> resolve_uncertain;
    std::function<void(const TrialOutcome&)> acknowledge_failure;
};

inline bool is_interactive_terminal() {
    return ::isatty(STDIN_FILENO) != 0 && ::isatty(STDOUT_FILENO) != 0;
}

inline void print_diagnostic(std::ostream& out, const TrialOutcome& o) {
    out << "[" << to_string(o.verdict) << "] trial " << o.trial
        << " query=" << to_string(o.query)
        << " fixture=" << o.fixture_path << "\n";
    if (!o.process_note.empty()) {
        out << "  process:  " << o.process_note << "\n";
    }
    out << "  expected: \"" << trim(o.expected) << "\"\n";
    out << "  actual:   \"" << trim(o.actual) << "\"\n";
}

inline ReviewHooks make_console_review_hooks(std::istream& in, std::ostream& out) {
    ReviewHooks hooks;
    hooks.resolve_uncertain = [&in, &out](const TrialOutcome& o) -> bool {
        out << "Output contains the expected answer but is not equal to it.\n";
        out << "Accept trial " << o.trial << " as correct? [y/N]: " << std::flush;
        std::string line;
        if (!std::getline(in, line)) {
            return false;
        }
        const std::string answer = trim(line);
        return answer == "y" || answer == "Y" || answer == "yes";
    };
    hooks.acknowledge_failure = [&in, &out](const TrialOutcome&) {
        out << "Press Enter to continue..." << std::flush;
        std::string line;
        std::getline(in, line);
    };
    return hooks;
}

// CI default: uncertain results count as failures and nothing blocks.
inline ReviewHooks make_unattended_review_hooks() {
    ReviewHooks hooks;
    hooks.resolve_uncertain = [](const TrialOutcome& o) -> bool {
        log_warn("review", "auto-rejected uncertain trial " + std::to_string(o.trial));
        return false;
    };
    hooks.acknowledge_failure = [](const TrialOutcome&) {};
    return hooks;
}

inline ReviewHooks make_review_hooks(ReviewPolicy policy) {
    const bool interactive = policy == ReviewPolicy::Interactive ||
                             (policy == ReviewPolicy::Auto && is_interactive_terminal());
    return interactive ? make_console_review_hooks(std::cin, std::cout) : make_unattended_review_hooks();
}

} // namespace figfuzz::harness
