// ============================================================================
// FIGSEARCH FUZZ - FIXTURE PIPELINE
// Module: generator_facade.h
// Description: one call per trial: pick the synthesizer for the query,
//              serialize the grid into the scratch directory and hand back
//              the expected stdout of the searcher.
// ============================================================================
//Author copyright Marcin Matysek (Rewertyn)

#pragma once

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

#include "../config/run_config.h"
#include "../core/random_source.h"
#include "../utils/logging.h"
#include "bitmap_writer.h"
#include "segment_synthesizer.h"
#include "square_synthesizer.h"

namespace figfuzz::generator {

inline constexpr const char* kValidAnswer = "Valid";
inline constexpr const char* kInvalidAnswer = "Invalid";

struct FixtureOptions {
    bool random_validity = false;
    bool fuzz_whitespace = false;
};

struct Fixture {
    std::string path;
    QueryKind query = QueryKind::Test;
    BitmapSize size{};
    std::string expected_stdout;
    bool valid = true;
};

// Content only, no file. Same seed and arguments give the same text.
struct RenderedFixture {
    std::string text;
    std::string expected_stdout;
    bool valid = true;
};

inline RenderedFixture render_fixture(QueryKind query, BitmapSize size, const FixtureOptions& opts, RandomSource& rng) {
    RenderedFixture out;
    WriterOptions wopts{};
    wopts.fuzz_whitespace = opts.fuzz_whitespace;

    switch (query) {
        case QueryKind::Test: {
            wopts.corrupt = opts.random_validity && rng.chance(0.5);
            const Bitmap bmp = random_bitmap(size, rng);
            WriteReport report{};
            out.text = render_bitmap(bmp, wopts, rng, &report);
            out.valid = report.valid();
            out.expected_stdout = out.valid ? kValidAnswer : kInvalidAnswer;
            break;
        }
        case QueryKind::HLine:
        case QueryKind::VLine: {
            const SegmentSynthesis synth = synthesize_segments(
                query == QueryKind::HLine ? Axis::Horizontal : Axis::Vertical, size, rng);
            out.text = render_bitmap(synth.bitmap, wopts, rng);
            out.expected_stdout = synth.oracle.wire();
            break;
        }
        case QueryKind::Square: {
            const SquareSynthesis synth = synthesize_squares(size, rng);
            out.text = render_bitmap(synth.bitmap, wopts, rng);
            out.expected_stdout = synth.wire();
            break;
        }
    }
    return out;
}

inline std::string fresh_fixture_path(const std::string& scratch_dir, QueryKind query, RandomSource& rng) {
    std::error_code ec;
    for (;;) {
        const std::filesystem::path p = std::filesystem::path(scratch_dir) /
            ("bmp_" + std::string(to_string(query)) + "_" + std::to_string(rng.uniform_int(0, 999999)));
        if (!std::filesystem::exists(p, ec)) {
            return p.string();
        }
    }
}

inline bool generate_fixture(
    QueryKind query,
    BitmapSize size,
    const FixtureOptions& opts,
    RandomSource& rng,
    const std::string& scratch_dir,
    Fixture& out,
    std::string* err = nullptr) {

    if (!size.is_valid()) {
        if (err != nullptr) *err = "bitmap size must be positive";
        return false;
    }

    RenderedFixture rendered = render_fixture(query, size, opts, rng);
    out = Fixture{};
    out.query = query;
    out.size = size;
    out.valid = rendered.valid;
    out.expected_stdout = std::move(rendered.expected_stdout);
    out.path = fresh_fixture_path(scratch_dir, query, rng);

    if (!write_text_file(out.path, rendered.text, err)) {
        log_error("generator", err != nullptr ? *err : "fixture write failed");
        return false;
    }
    log_info("generator",
             std::string("fixture ") + to_string(query) + " " + std::to_string(size.height) + "x" +
             std::to_string(size.width) + " -> " + out.path + " expect=\"" + out.expected_stdout + "\"");
    return true;
}

} // namespace figfuzz::generator
