// ============================================================================
// FIGSEARCH FUZZ - HARNESS RUNTIME
// Module: runtime_runner.h
// Description: the sequential trial loop. For every trial and every selected
//              query: generate fixture -> spawn searcher -> classify ->
//              (optionally) wait for the operator -> next.
//              Timed mode only measures wall clock and treats a nonzero exit
//              code as fatal.
// ============================================================================

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "../config/run_config.h"
#include "../core/random_source.h"
#include "../generator/generator_facade.h"
#include "../utils/logging.h"
#include "comparator.h"
#include "process_runner.h"
#include "review.h"
#include "scratch_dir.h"

namespace figfuzz::harness {

struct QueryStats {
    uint64_t trials = 0;
    uint64_t passed = 0;
    uint64_t failed = 0;
    uint64_t reviewed_accepted = 0;
    uint64_t reviewed_rejected = 0;
    uint64_t process_failures = 0;
    double total_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;

    double avg_ms() const {
        return trials > 0 ? total_ms / static_cast<double>(trials) : 0.0;
    }

    void add_duration(double ms) {
        min_ms = trials == 0 ? ms : std::min(min_ms, ms);
        max_ms = trials == 0 ? ms : std::max(max_ms, ms);
        total_ms += ms;
        ++trials;
    }
};

struct HarnessRunResult {
    HarnessMode mode = HarnessMode::Functional;
    HarnessError fatal = HarnessError::None;
    std::string fatal_reason;

    uint64_t seed = 0;
    uint64_t trials_run = 0;
    uint64_t passed = 0;
    uint64_t failed = 0;

    std::array<QueryStats, kAllQueries.size()> per_query{};
    std::vector<TrialOutcome> failures;
    double elapsed_s = 0.0;

    bool aborted() const {
        return fatal != HarnessError::None;
    }

    bool all_passed() const {
        return !aborted() && failed == 0;
    }

    QueryStats& stats(QueryKind q) {
        return per_query[static_cast<size_t>(q)];
    }

    const QueryStats& stats(QueryKind q) const {
        return per_query[static_cast<size_t>(q)];
    }
};

inline int64_t timeout_ms_from_env() {
    const char* raw = std::getenv("FIGFUZZ_TIMEOUT_MS");
    if (raw == nullptr || *raw == '\0') {
        return 0;
    }
    char* end = nullptr;
    const long long v = std::strtoll(raw, &end, 10);
    if (end == raw || *end != '\0' || v < 0) {
        log_warn("runner", std::string("ignoring FIGFUZZ_TIMEOUT_MS=") + raw);
        return 0;
    }
    return static_cast<int64_t>(v);
}

inline int64_t resolve_timeout_ms(const HarnessRunConfig& cfg) {
    return cfg.timeout_ms >= 0 ? cfg.timeout_ms : timeout_ms_from_env();
}

inline bool check_program_under_test(const std::string& exec, std::string* err) {
    if (exec.empty()) {
        if (err != nullptr) *err = "missing path to the program under test";
        return false;
    }
    // Bare names are looked up in PATH by posix_spawnp.
    if (exec.find('/') != std::string::npos && ::access(exec.c_str(), X_OK) != 0) {
        if (err != nullptr) *err = "program under test is not executable: " + exec;
        return false;
    }
    return true;
}

inline BitmapSize trial_size(const HarnessRunConfig& cfg, RandomSource& rng) {
    const BitmapSize fixed = configured_size(cfg);
    if (fixed.is_valid()) {
        return fixed;
    }
    const int dim = std::max(1, cfg.max_dim);
    const int width = rng.uniform_int(1, dim);
    const int height = rng.uniform_int(1, dim);
    return BitmapSize{width, height};
}

inline std::vector<std::string> searcher_command(const HarnessRunConfig& cfg, QueryKind query, const std::string& fixture_path) {
    return {cfg.exec_path, to_string(query), fixture_path};
}

inline ProcessResult spawn_searcher(const HarnessRunConfig& cfg, QueryKind query, const std::string& fixture_path, int64_t timeout_ms) {
    const std::vector<std::string> argv = searcher_command(cfg, query, fixture_path);
    ProcessResult proc = run_process(argv, timeout_ms);
    const std::string line = argv[0] + " " + argv[1] + " " + argv[2];
    if (proc.succeeded()) {
        log_info("process", line + " ok " + std::to_string(static_cast<int64_t>(proc.elapsed_ms)) + "ms");
    } else {
        log_warn("process", line + " " + proc.describe() + (proc.error.empty() ? "" : " (" + proc.error + ")"));
    }
    return proc;
}

inline void abort_run(HarnessRunResult& result, HarnessError kind, const std::string& reason, std::ostream& out) {
    result.fatal = kind;
    result.fatal_reason = reason;
    log_error("runner", std::string(to_string(kind)) + ": " + reason);
    out << "FATAL (" << to_string(kind) << "): " << reason << "\n";
}

// Shared preamble of both modes: program check, scratch cleanup, seeding.
inline bool begin_run(const HarnessRunConfig& cfg, HarnessRunResult& result, std::ostream& out) {
    result.mode = cfg.mode;
    result.seed = cfg.seed != 0 ? cfg.seed : time_based_seed();
    run_log().set_run_seed(result.seed);

    std::string err;
    if (!check_program_under_test(cfg.exec_path, &err)) {
        abort_run(result, HarnessError::PreconditionViolation, err, out);
        return false;
    }
    if (!prepare_scratch_directory(cfg.scratch_dir, &err)) {
        abort_run(result, HarnessError::PreconditionViolation, err, out);
        return false;
    }
    log_info("runner", std::string("mode=") + to_string(cfg.mode) +
                       " exec=" + cfg.exec_path +
                       " seed=" + std::to_string(result.seed) +
                       " trials=" + std::to_string(cfg.trials));
    return true;
}

inline TrialOutcome classify_trial(
    uint64_t trial,
    const generator::Fixture& fixture,
    const ProcessResult& proc) {

    TrialOutcome o;
    o.trial = trial;
    o.query = fixture.query;
    o.fixture_path = fixture.path;
    o.expected = fixture.expected_stdout;
    o.actual = proc.stdout_text;
    o.elapsed_ms = proc.elapsed_ms;

    if (!proc.succeeded()) {
        o.verdict = Verdict::Fail;
        o.error = HarnessError::ProcessFailure;
        o.process_note = proc.describe();
        return o;
    }
    o.verdict = compare_output(proc.stdout_text, fixture.expected_stdout);
    if (o.verdict == Verdict::Fail) {
        o.error = HarnessError::OutputMismatch;
    }
    return o;
}

inline void settle_outcome(TrialOutcome& o, const ReviewHooks& hooks, std::ostream& out) {
    if (o.verdict == Verdict::Pass) {
        return;
    }
    print_diagnostic(out, o);
    if (o.verdict == Verdict::NeedsReview) {
        o.reviewed = true;
        o.accepted = hooks.resolve_uncertain ? hooks.resolve_uncertain(o) : false;
        out << "  review: " << (o.accepted ? "accepted" : "rejected") << "\n";
        return;
    }
    if (hooks.acknowledge_failure) {
        hooks.acknowledge_failure(o);
    }
}

inline void record_outcome(HarnessRunResult& result, const TrialOutcome& o) {
    QueryStats& s = result.stats(o.query);
    s.add_duration(o.elapsed_ms);
    if (o.error == HarnessError::ProcessFailure) {
        ++s.process_failures;
    }
    if (o.reviewed) {
        ++(o.accepted ? s.reviewed_accepted : s.reviewed_rejected);
    }
    if (o.passed()) {
        ++s.passed;
        ++result.passed;
    } else {
        ++s.failed;
        ++result.failed;
        result.failures.push_back(o);
    }
    log_info("verdict", std::string(to_string(o.query)) + " trial=" + std::to_string(o.trial) +
                        " verdict=" + to_string(o.verdict) +
                        (o.reviewed ? (o.accepted ? " review=accepted" : " review=rejected") : "") +
                        " error=" + to_string(o.error));
}

inline HarnessRunResult run_functional(const HarnessRunConfig& cfg, const ReviewHooks& hooks, std::ostream& out = std::cout) {
    using namespace std::chrono;
    HarnessRunResult result;
    const auto t0 = steady_clock::now();
    out << "[functionality test]\n\n";

    if (!begin_run(cfg, result, out)) {
        return result;
    }
    RandomSource rng(result.seed);
    const int64_t timeout_ms = resolve_timeout_ms(cfg);
    generator::FixtureOptions opts{cfg.random_validity, cfg.fuzz_whitespace};

    for (uint64_t trial = 1; trial <= cfg.trials; ++trial) {
        const BitmapSize size = trial_size(cfg, rng);
        for (QueryKind query : cfg.queries) {
            generator::Fixture fixture;
            std::string err;
            if (!generator::generate_fixture(query, size, opts, rng, cfg.scratch_dir, fixture, &err)) {
                abort_run(result, HarnessError::PreconditionViolation, err, out);
                result.elapsed_s = duration<double>(steady_clock::now() - t0).count();
                return result;
            }

            const ProcessResult proc = spawn_searcher(cfg, query, fixture.path, timeout_ms);
            TrialOutcome outcome = classify_trial(trial, fixture, proc);
            settle_outcome(outcome, hooks, out);
            record_outcome(result, outcome);
        }
        ++result.trials_run;
    }

    result.elapsed_s = duration<double>(steady_clock::now() - t0).count();
    out << "Passed " << result.passed << " / " << (result.passed + result.failed)
        << " checks (seed " << result.seed << ")\n";
    return result;
}

inline HarnessRunResult run_timed(const HarnessRunConfig& cfg, std::ostream& out = std::cout) {
    using namespace std::chrono;
    HarnessRunResult result;
    const auto t0 = steady_clock::now();
    out << "[timed test]\n\n";

    if (!begin_run(cfg, result, out)) {
        return result;
    }
    RandomSource rng(result.seed);
    const int64_t timeout_ms = resolve_timeout_ms(cfg);
    generator::FixtureOptions opts{cfg.random_validity, cfg.fuzz_whitespace};

    for (uint64_t trial = 1; trial <= cfg.trials; ++trial) {
        const BitmapSize size = trial_size(cfg, rng);
        for (QueryKind query : cfg.queries) {
            generator::Fixture fixture;
            std::string err;
            if (!generator::generate_fixture(query, size, opts, rng, cfg.scratch_dir, fixture, &err)) {
                abort_run(result, HarnessError::PreconditionViolation, err, out);
                result.elapsed_s = duration<double>(steady_clock::now() - t0).count();
                return result;
            }

            const ProcessResult proc = spawn_searcher(cfg, query, fixture.path, timeout_ms);
            if (!proc.succeeded()) {
                abort_run(result, HarnessError::ProcessFailure,
                          std::string(to_string(query)) + " on " + fixture.path + ": " + proc.describe() +
                          "; expected exit code 0",
                          out);
                result.elapsed_s = duration<double>(steady_clock::now() - t0).count();
                return result;
            }
            result.stats(query).add_duration(proc.elapsed_ms);
            ++result.stats(query).passed;
            ++result.passed;
            out << "Test took: " << std::fixed << std::setprecision(3) << proc.elapsed_ms
                << "ms (" << to_string(query) << ", " << size.height << "x" << size.width << ")\n";
        }
        ++result.trials_run;
    }

    out << "\n";
    for (QueryKind query : cfg.queries) {
        const QueryStats& s = result.stats(query);
        out << "Average " << to_string(query) << ": " << std::fixed << std::setprecision(3)
            << s.avg_ms() << "ms over " << s.trials << " trials\n";
    }
    result.elapsed_s = duration<double>(steady_clock::now() - t0).count();
    return result;
}

} // namespace figfuzz::harness
