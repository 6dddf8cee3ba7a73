// ============================================================================
// FIGSEARCH FUZZ - WIRE ORDER PROBE
// Module: wire_conformance.h
// Description: checks that the searcher prints coordinates in the order the
//              generators serialize them (row-major: r0 c0 r1 c1). Each probe
//              is a fixed fixture with exactly one run whose row and column
//              coordinates differ, so a swapped order is detectable.
// ============================================================================

#pragma once

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "../config/run_config.h"
#include "../core/bitmap.h"
#include "../core/random_source.h"
#include "../generator/bitmap_writer.h"
#include "../utils/logging.h"
#include "comparator.h"
#include "process_runner.h"
#include "runtime_runner.h"
#include "scratch_dir.h"

namespace figfuzz::harness {

enum class WireOrder : uint8_t {
    Conforms = 0,
    ColumnMajor,
    Unrecognized,
};

inline const char* to_string(WireOrder w) {
    switch (w) {
        case WireOrder::Conforms: return "conforms";
        case WireOrder::ColumnMajor: return "column-major";
        case WireOrder::Unrecognized: return "unrecognized";
    }
    return "unrecognized";
}

struct WireProbe {
    QueryKind query = QueryKind::HLine;
    Bitmap bitmap;
    Line expected{};

    std::string row_major() const {
        return to_wire(expected);
    }

    std::string column_major() const {
        return to_wire(Point{expected.begin.col, expected.begin.row}, Point{expected.end.col, expected.end.row});
    }
};

inline std::vector<WireProbe> wire_probes() {
    std::vector<WireProbe> probes;

    WireProbe h;
    h.query = QueryKind::HLine;
    h.bitmap = Bitmap(BitmapSize{7, 4});
    h.bitmap.fill_row(2, 1, 5);
    h.expected = Line{Point{2, 1}, Point{2, 4}};
    probes.push_back(h);

    WireProbe v;
    v.query = QueryKind::VLine;
    v.bitmap = Bitmap(BitmapSize{5, 6});
    v.bitmap.fill_col(3, 0, 4);
    v.expected = Line{Point{0, 3}, Point{3, 3}};
    probes.push_back(v);

    return probes;
}

inline WireOrder classify_wire_order(const std::string& actual, const WireProbe& probe) {
    const std::string a = trim(actual);
    if (a == probe.row_major()) return WireOrder::Conforms;
    if (a == probe.column_major()) return WireOrder::ColumnMajor;
    return WireOrder::Unrecognized;
}

struct WireConformanceResult {
    WireOrder order = WireOrder::Unrecognized;
    bool precondition_failed = false;
    std::string reason;
};

inline WireConformanceResult check_wire_order(const HarnessRunConfig& cfg, std::ostream& out = std::cout) {
    WireConformanceResult result;
    std::string err;
    if (!check_program_under_test(cfg.exec_path, &err) || !prepare_scratch_directory(cfg.scratch_dir, &err)) {
        result.precondition_failed = true;
        result.reason = err;
        return result;
    }
    const int64_t timeout_ms = resolve_timeout_ms(cfg);

    RandomSource unused_rng(0);
    const generator::WriterOptions plain{};
    bool any_column_major = false;
    bool any_unrecognized = false;

    for (const WireProbe& probe : wire_probes()) {
        const std::string path = (std::filesystem::path(cfg.scratch_dir) /
                                  (std::string("wire_probe_") + to_string(probe.query))).string();
        if (!generator::write_text_file(path, generator::render_bitmap(probe.bitmap, plain, unused_rng), &err)) {
            result.precondition_failed = true;
            result.reason = err;
            return result;
        }

        const ProcessResult proc = run_process({cfg.exec_path, to_string(probe.query), path}, timeout_ms);
        WireOrder order = WireOrder::Unrecognized;
        if (proc.succeeded()) {
            order = classify_wire_order(proc.stdout_text, probe);
        }
        out << to_string(probe.query) << " probe: expected \"" << probe.row_major()
            << "\", got \"" << trim(proc.stdout_text) << "\""
            << (proc.succeeded() ? "" : " (" + proc.describe() + ")")
            << " -> " << to_string(order) << "\n";
        log_info("wire", std::string(to_string(probe.query)) + " -> " + to_string(order));

        any_column_major = any_column_major || order == WireOrder::ColumnMajor;
        any_unrecognized = any_unrecognized || order == WireOrder::Unrecognized;
    }

    if (any_unrecognized) {
        result.order = WireOrder::Unrecognized;
    } else if (any_column_major) {
        result.order = WireOrder::ColumnMajor;
    } else {
        result.order = WireOrder::Conforms;
    }
    return result;
}

} // namespace figfuzz::harness
