
//Author copyright Marcin Matysek (Rewertyn)

#include <cstdint>
#include <iostream>
#include <string>

#include "Sources/config/run_config.h"
#include "Sources/cli/arg_parser.h"
#include "Sources/utils/logging.h"
#include "Sources/harness/review.h"
#include "Sources/harness/runtime_runner.h"
#include "Sources/harness/run_summary.h"
#include "Sources/harness/wire_conformance.h"

namespace figfuzz {

    inline constexpr int kExitOk = 0;
    inline constexpr int kExitTrialsFailed = 1;
    inline constexpr int kExitPrecondition = 2;
    inline constexpr int kExitProcessFailure = 3;

    inline void print_production_help(std::ostream& out) {
        out << "figsearch fuzz harness\n";
        out << "Usage:\n";
        out << "  figsearch_fuzz [options] --exec <path>\n";
        out << "  figsearch_fuzz <functional|timed> <path>\n\n";
        out << "Common options:\n";
        out << "  --help, -h                      Show this help\n";
        out << "  --mode <functional|timed>       Harness mode (default functional)\n";
        out << "  --exec <path>                   Program under test\n";
        out << "  --random-validity               Corrupt 'test' fixtures on a fair coin\n";
        out << "  --fuzz-whitespace               Random whitespace runs as separators\n";
        out << "  --verbose, -v                   Print the per-query summary table\n";
        out << "  --trials <uint64>               Trials per query (default 10)\n";
        out << "  --seed <uint64>                 RNG seed (0=random)\n";
        out << "  --width <int> --height <int>    Fixed bitmap size\n";
        out << "  --max-dim <int>                 Upper bound of random sizes (default 64)\n";
        out << "  --queries <list>                Comma list of test,hline,vline,square\n";
        out << "  --scratch-dir <path>            Fixture directory, emptied first (default pics)\n";
        out << "  --timeout-ms <int64>            Per-run timeout (0=none, env FIGFUZZ_TIMEOUT_MS)\n";
        out << "  --interactive                   Ask the operator about uncertain results\n";
        out << "  --unattended                    Reject uncertain results, never block\n";
        out << "  --check-wire-order              Probe the searcher's coordinate order and exit\n\n";
        out << "Exit codes: 0 all passed, 1 trial failures, 2 precondition, 3 searcher failure (timed)\n\n";
        out << "Examples:\n";
        out << "  figsearch_fuzz functional ./figsearch\n";
        out << "  figsearch_fuzz --exec ./figsearch --random-validity --fuzz-whitespace --trials 200 --unattended\n";
        out << "  figsearch_fuzz --mode timed --exec ./figsearch --queries hline,square --trials 5\n";
    }

    inline int exit_code_for(const harness::HarnessRunResult& result) {
        switch (result.fatal) {
            case HarnessError::PreconditionViolation: return kExitPrecondition;
            case HarnessError::ProcessFailure: return kExitProcessFailure;
            case HarnessError::OutputMismatch:
            case HarnessError::None: break;
        }
        return result.failed == 0 ? kExitOk : kExitTrialsFailed;
    }

    inline int run_wire_order_cli(const HarnessRunConfig& cfg) {
        const harness::WireConformanceResult r = harness::check_wire_order(cfg, std::cout);
        if (r.precondition_failed) {
            std::cerr << "wire order probe: " << r.reason << "\n";
            log_error("main", "wire order probe: " + r.reason);
            return kExitPrecondition;
        }
        std::cout << "Wire order: " << harness::to_string(r.order) << "\n";
        return r.order == harness::WireOrder::Conforms ? kExitOk : kExitTrialsFailed;
    }

    inline void handle_result(const harness::HarnessRunResult& result, const HarnessRunConfig& cfg) {
        if (cfg.verbose) {
            std::cout << "\n" << harness::render_run_summary(cfg, result);
        }
        if (!result.failures.empty()) {
            std::cout << "\nFailed trials: " << result.failures.size() << "\n";
            for (const harness::TrialOutcome& o : result.failures) {
                std::cout << "  " << to_string(o.query) << " trial " << o.trial
                          << " (" << to_string(o.error) << ") " << o.fixture_path << "\n";
            }
        }
        log_info("main", std::string("run finished passed=") + std::to_string(result.passed) +
                         " failed=" + std::to_string(result.failed) +
                         " fatal=" + to_string(result.fatal));
    }
}

int main(int argc, char** argv) {
    using namespace figfuzz;
    log_info("main", "program start");
    std::cout << "Run log file: " << run_log().path() << "\n";

    if (has_arg(argc, argv, "--help") || has_arg(argc, argv, "-h")) {
        print_production_help(std::cout);
        return kExitOk;
    }

    ParseArgsResult parse_result = parse_args(argc, argv);
    if (!parse_result.ok()) {
        for (const std::string& e : parse_result.errors) {
            std::cerr << "error: " << e << "\n";
            log_error("main.args", e);
        }
        std::cerr << "\n";
        print_production_help(std::cerr);
        return kExitPrecondition;
    }
    const HarnessRunConfig& cfg = parse_result.cfg;

    if (cfg.check_wire_order) {
        return run_wire_order_cli(cfg);
    }

    harness::HarnessRunResult result;
    if (cfg.mode == HarnessMode::Timed) {
        result = harness::run_timed(cfg, std::cout);
    } else {
        const harness::ReviewHooks hooks = harness::make_review_hooks(cfg.review);
        result = harness::run_functional(cfg, hooks, std::cout);
    }
    handle_result(result, cfg);
    return exit_code_for(result);
}
