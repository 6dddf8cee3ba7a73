// ============================================================================
// FIGSEARCH FUZZ - GENERATOR TESTS (geometry, writer, synthesizers)
// Plik: test_generator.cpp
// Uwaga: brak include guard - ten plik jest wciągany jako unity-include
// ============================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include "../core/bitmap.h"
#include "../core/geometry.h"
#include "../core/random_source.h"
#include "../generator/bitmap_writer.h"
#include "../generator/generator_facade.h"
#include "../generator/segment_synthesizer.h"
#include "../generator/square_synthesizer.h"

namespace figfuzz_testy {

using namespace figfuzz;
using namespace figfuzz::generator;

// Independent scan of the grid for the longest run, ties broken the way the
// searcher breaks them: smaller start row, then smaller start col.
inline Line first_longest_run(const Bitmap& bmp, Axis axis, int* cells_out) {
    const int lanes = axis == Axis::Horizontal ? bmp.height() : bmp.width();
    const int extent = axis == Axis::Horizontal ? bmp.width() : bmp.height();
    Line best{};
    int best_cells = 0;
    for (int lane = 0; lane < lanes; ++lane) {
        int pos = 0;
        while (pos < extent) {
            const bool set = axis == Axis::Horizontal ? bmp.at(lane, pos) != 0 : bmp.at(pos, lane) != 0;
            if (!set) { ++pos; continue; }
            const int begin = pos;
            while (pos < extent && (axis == Axis::Horizontal ? bmp.at(lane, pos) != 0 : bmp.at(pos, lane) != 0)) ++pos;
            const Line run = lane_line(axis, lane, Segment{begin, pos});
            const bool earlier = best_cells > 0 &&
                (run.begin.row < best.begin.row || (run.begin.row == best.begin.row && run.begin.col < best.begin.col));
            if (pos - begin > best_cells || (pos - begin == best_cells && earlier)) {
                best_cells = pos - begin;
                best = run;
            }
        }
    }
    if (cells_out != nullptr) *cells_out = best_cells;
    return best;
}

// ============================================================================
// TEST 1: geometry and wire format
// ============================================================================

inline TestResult test_geometry_wire() {
    CheckList t("Geometry wire format");

    const Line h{Point{2, 1}, Point{2, 4}};
    t.expect(to_wire(h) == "2 1 2 4", "hline wire is row-major");
    t.expect(h.length() == 3 && h.is_horizontal() && !h.is_vertical(), "hline length/axis");

    const Line single{Point{5, 5}, Point{5, 5}};
    t.expect(single.length() == 0, "single cell line has length 0");

    const Square sq = make_square(1, 2, 3);
    t.expect(sq.side() == 3, "square side");
    t.expect(to_wire(sq) == "1 2 3 4", "square wire is top-left then bottom-right");
    t.expect(sq.inside(BitmapSize{5, 4}), "square fits 5x4");
    t.expect(!sq.inside(BitmapSize{4, 4}), "square does not fit 4x4");
    t.expect(sq.covers(3, 4) && !sq.covers(0, 2), "square covers");

    t.expect(square_beats(make_square(5, 5, 2), make_square(0, 0, 1)), "larger side wins");
    t.expect(square_beats(make_square(0, 9, 2), make_square(1, 0, 2)), "tie: smaller row wins");
    t.expect(square_beats(make_square(1, 0, 2), make_square(1, 3, 2)), "tie: smaller col wins");
    t.expect(!square_beats(make_square(1, 3, 2), make_square(1, 3, 2)), "equal square does not beat");

    t.expect(std::string(not_found_wire()) == "Not found", "empty result wire");
    t.expect(!BitmapSize{0, 3}.is_valid() && BitmapSize{1, 1}.is_valid(), "size validity");
    return t.finish();
}

// ============================================================================
// TEST 2: writer layout (10x10, no fuzz)
// ============================================================================

inline TestResult test_writer_plain_layout() {
    CheckList t("Writer 10x10 plain layout");
    RandomSource rng(1002);
    const Bitmap bmp = random_bitmap(BitmapSize{10, 10}, rng);
    const std::string text = render_bitmap(bmp, WriterOptions{}, rng);

    const std::vector<std::string> lines = split_lines(text);
    t.expect(lines.size() == 11, "11 lines, got " + std::to_string(lines.size()));
    t.expect(!lines.empty() && lines[0] == "10 10", "header line is \"10 10\"");
    t.expect(!text.empty() && text.back() == '\n', "last row ends with newline");
    for (size_t i = 1; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        t.expect(line.size() == 19, "row " + std::to_string(i) + " is 10 bits joined by single spaces");
        for (size_t k = 0; k < line.size(); ++k) {
            const bool ok = (k % 2 == 0) ? (line[k] == '0' || line[k] == '1') : line[k] == ' ';
            if (!t.expect(ok, "row " + std::to_string(i) + " char " + std::to_string(k))) break;
        }
    }
    return t.finish();
}

// ============================================================================
// TEST 3: header decodes to H W, exactly H*W bit tokens follow
// ============================================================================

inline TestResult test_writer_header_and_tokens(const SeedEntry& e) {
    CheckList t(std::string("Writer tokens ") + e.desc);
    RandomSource rng(e.seed);
    const BitmapSize size{e.width, e.height};
    const Bitmap bmp = random_bitmap(size, rng);
    WriteReport report{};
    const std::string text = render_bitmap(bmp, WriterOptions{}, rng, &report);

    const std::vector<std::string> tokens = split_whitespace(text);
    t.expect(report.valid(), "plain render reports valid");
    t.expect(tokens.size() == static_cast<size_t>(e.width * e.height + 2), "token count");
    if (tokens.size() >= 2) {
        t.expect(tokens[0] == std::to_string(e.height), "first header token is height");
        t.expect(tokens[1] == std::to_string(e.width), "second header token is width");
    }
    t.expect(static_cast<int>(std::count(text.begin(), text.end(), '\n')) == e.height + 1, "H+1 newlines");

    size_t k = 2;
    for (int r = 0; r < e.height; ++r) {
        for (int c = 0; c < e.width && k < tokens.size(); ++c, ++k) {
            const std::string want(1, bmp.at(r, c) != 0 ? kPixelFilled : kPixelEmpty);
            if (!t.expect(tokens[k] == want, "cell " + std::to_string(r) + "," + std::to_string(c))) {
                r = e.height;
                break;
            }
        }
    }
    return t.finish();
}

// ============================================================================
// TEST 4: whitespace fuzz keeps the token stream intact
// ============================================================================

inline TestResult test_writer_whitespace_fuzz() {
    CheckList t("Writer whitespace fuzz");
    const std::string allowed_ws(kFuzzWhitespace.begin(), kFuzzWhitespace.end());

    for (const SeedEntry& e : get_seed_corpus()) {
        RandomSource rng(e.seed);
        const Bitmap bmp = random_bitmap(BitmapSize{e.width, e.height}, rng);
        WriterOptions opts{};
        opts.fuzz_whitespace = true;
        const std::string text = render_bitmap(bmp, opts, rng);

        bool chars_ok = true;
        size_t run = 0;
        size_t longest_run = 0;
        for (const char ch : text) {
            const bool ws = allowed_ws.find(ch) != std::string::npos;
            const bool digit = std::isdigit(static_cast<unsigned char>(ch)) != 0;
            chars_ok = chars_ok && (ws || digit);
            run = ws ? run + 1 : 0;
            longest_run = std::max(longest_run, run);
        }
        t.expect(chars_ok, std::string("only digits and fuzz whitespace: ") + e.desc);
        // Separators only ever sit between tokens, so every run is one draw.
        t.expect(longest_run >= 1 && longest_run <= 10, std::string("whitespace runs within 1..10: ") + e.desc);

        const std::vector<std::string> tokens = split_whitespace(text);
        bool same = tokens.size() == static_cast<size_t>(e.width * e.height + 2);
        for (int i = 0; same && i < e.width * e.height; ++i) {
            const char want = bmp.cells()[static_cast<size_t>(i)] != 0 ? kPixelFilled : kPixelEmpty;
            same = tokens[static_cast<size_t>(i) + 2] == std::string(1, want);
        }
        t.expect(same, std::string("tokens decode back to the grid: ") + e.desc);
    }
    return t.finish();
}

// ============================================================================
// TEST 5: corruption report agrees with the text
// ============================================================================

inline TestResult test_writer_corruption_report() {
    CheckList t("Writer corruption report");
    int invalid_seen = 0;
    int header_altered_seen = 0;

    for (uint64_t seed = 1; seed <= 200; ++seed) {
        RandomSource rng(seed);
        const BitmapSize size{1 + static_cast<int>(seed % 5), 1 + static_cast<int>(seed % 3)};
        const Bitmap bmp = random_bitmap(size, rng);
        WriterOptions opts{};
        opts.corrupt = true;
        WriteReport report{};
        const std::string text = render_bitmap(bmp, opts, rng, &report);

        const std::vector<std::string> tokens = split_whitespace(text);
        if (!t.expect(tokens.size() == static_cast<size_t>(size.width * size.height + 2),
                      "body keeps its real size, seed " + std::to_string(seed))) {
            continue;
        }
        const int h = std::stoi(tokens[0]);
        const int w = std::stoi(tokens[1]);
        t.expect(h >= 0 && h <= size.height && w >= 0 && w <= size.width,
                 "corrupted header within [0, real value], seed " + std::to_string(seed));

        uint64_t bad_cells = 0;
        for (size_t i = 2; i < tokens.size(); ++i) {
            if (tokens[i] != "0" && tokens[i] != "1") {
                ++bad_cells;
                t.expect(tokens[i].size() == 1 && kInvalidSymbols.find(tokens[i][0]) != std::string_view::npos,
                         "invalid symbol from the table, seed " + std::to_string(seed));
            }
        }
        const bool text_valid = h == size.height && w == size.width && bad_cells == 0;
        t.expect(report.valid() == text_valid, "report.valid matches text, seed " + std::to_string(seed));
        t.expect(report.corrupted_cells == bad_cells, "corrupted cell count, seed " + std::to_string(seed));
        invalid_seen += text_valid ? 0 : 1;
        header_altered_seen += report.header_altered ? 1 : 0;
    }
    t.expect(invalid_seen > 100, "most corrupted renders are invalid");
    t.expect(header_altered_seen > 0, "some headers were altered");
    return t.finish();
}

// ============================================================================
// TEST 6: same seed, same bytes
// ============================================================================

inline TestResult test_fixture_determinism() {
    CheckList t("Fixture determinism");
    FixtureOptions opts{};
    opts.random_validity = true;
    opts.fuzz_whitespace = true;

    for (const SeedEntry& e : get_seed_corpus()) {
        for (QueryKind q : kAllQueries) {
            RandomSource a(e.seed);
            RandomSource b(e.seed);
            const RenderedFixture fa = render_fixture(q, BitmapSize{e.width, e.height}, opts, a);
            const RenderedFixture fb = render_fixture(q, BitmapSize{e.width, e.height}, opts, b);
            t.expect(fa.text == fb.text && fa.expected_stdout == fb.expected_stdout && fa.valid == fb.valid,
                     std::string(to_string(q)) + " " + e.desc);
        }
    }

    RandomSource a(77);
    RandomSource b(78);
    const RenderedFixture fa = render_fixture(QueryKind::Test, BitmapSize{16, 16}, FixtureOptions{}, a);
    const RenderedFixture fb = render_fixture(QueryKind::Test, BitmapSize{16, 16}, FixtureOptions{}, b);
    t.expect(fa.text != fb.text, "different seeds give different grids");
    return t.finish();
}

// ============================================================================
// TEST 7: segment synthesizer invariants
// ============================================================================

inline TestResult test_segment_invariants(Axis axis) {
    CheckList t(axis == Axis::Horizontal ? "Segment invariants hline" : "Segment invariants vline");

    for (const SeedEntry& e : get_seed_corpus()) {
        for (uint64_t k = 0; k < 8; ++k) {
            RandomSource rng(e.seed * 31 + k);
            const BitmapSize size{e.width, e.height};
            const SegmentSynthesis s = synthesize_segments(axis, size, rng);
            const int extent = axis == Axis::Horizontal ? e.width : e.height;
            const std::string where = std::string(e.desc) + " k=" + std::to_string(k);

            int max_local = 0;
            uint64_t total_cells = 0;
            for (const AxisSegments& lane : s.lanes) {
                t.expect(lane.maxlen >= 0 && lane.maxlen <= maxlen_bound(axis, extent), "maxlen bound " + where);
                for (size_t i = 0; i < lane.segments.size(); ++i) {
                    const Segment& seg = lane.segments[i];
                    t.expect(seg.begin >= 0 && seg.begin <= seg.end && seg.end <= extent, "segment in range " + where);
                    t.expect(seg.cells() <= lane.maxlen, "segment within maxlen " + where);
                    if (i > 0) {
                        t.expect(seg.begin > lane.segments[i - 1].end, "disjoint, increasing " + where);
                    }
                    total_cells += static_cast<uint64_t>(seg.cells());
                }
                max_local = std::max(max_local, lane.longest_cells());
                t.expect(s.oracle.run_cells >= lane.longest_cells(), "oracle >= row-local max " + where);
            }
            t.expect(s.oracle.run_cells == max_local, "oracle equals the global max " + where);
            t.expect(s.bitmap.count_set() == total_cells, "bitmap holds exactly the segments " + where);

            int scanned_cells = 0;
            const Line scanned = first_longest_run(s.bitmap, axis, &scanned_cells);
            t.expect(scanned_cells == s.oracle.run_cells, "scan agrees on length " + where);
            if (s.oracle.found()) {
                t.expect(scanned == s.oracle.longest, "tie order matches the searcher " + where);
                t.expect(s.oracle.longest.length() == s.oracle.run_cells - 1, "inclusive end " + where);
                t.expect(axis == Axis::Horizontal ? s.oracle.longest.is_horizontal() : s.oracle.longest.is_vertical(),
                         "oracle on its axis " + where);
                t.expect(s.oracle.wire() == to_wire(s.oracle.longest), "wire " + where);
            } else {
                t.expect(s.oracle.wire() == "Not found", "empty grid wire " + where);
            }
        }
    }
    return t.finish();
}

// ============================================================================
// TEST 8: zero extent never enters the lane loop
// ============================================================================

inline TestResult test_segment_zero_extent() {
    CheckList t("Segment zero extent");

    RandomSource used(99);
    RandomSource fresh(99);
    const AxisSegments lane = synthesize_lane(0, 0, 0, used);
    t.expect(lane.segments.empty() && lane.maxlen == 0 && lane.longest == -1, "no segments");
    t.expect(used.uniform_int(0, 1000000) == fresh.uniform_int(0, 1000000), "no random draws");

    RandomSource rng(5);
    const SegmentSynthesis s = synthesize_hlines(BitmapSize{0, 5}, rng);
    t.expect(s.lanes.size() == 5, "one lane per row");
    t.expect(!s.oracle.found() && s.oracle.longest.length() == 0, "degenerate zero-length line");
    t.expect(s.oracle.wire() == "Not found", "serialized as Not found");

    const SegmentSynthesis v = synthesize_vlines(BitmapSize{3, 2}, rng);
    t.expect(!v.oracle.found() && v.bitmap.count_set() == 0, "vline cap 2/3 == 0 leaves the grid empty");
    return t.finish();
}

// ============================================================================
// TEST 9: half-open runs map to inclusive wire coordinates
// ============================================================================

inline TestResult test_segment_wire_correction() {
    CheckList t("Segment wire correction");
    t.expect(to_wire(lane_line(Axis::Horizontal, 2, Segment{1, 5})) == "2 1 2 4", "hline [1,5) on row 2");
    t.expect(to_wire(lane_line(Axis::Vertical, 3, Segment{0, 4})) == "0 3 3 3", "vline [0,4) on col 3");
    t.expect(lane_line(Axis::Horizontal, 0, Segment{6, 7}).length() == 0, "one cell run");

    Bitmap bmp(BitmapSize{7, 4});
    bmp.fill_row(2, 1, 5);
    int cells = 0;
    const Line found = first_longest_run(bmp, Axis::Horizontal, &cells);
    t.expect(cells == 4 && to_wire(found) == "2 1 2 4", "scan of a lone run");
    return t.finish();
}

// ============================================================================
// TEST 9b: equal runs in different lanes
// ============================================================================

inline TestResult test_segment_tie_order() {
    CheckList t("Segment tie order");

    SegmentOracle v;
    t.expect(run_beats(Axis::Vertical, 4, Line{Point{5, 1}, Point{8, 1}}, v), "first run beats nothing");
    v.run_cells = 4;
    v.longest = Line{Point{5, 1}, Point{8, 1}};
    t.expect(run_beats(Axis::Vertical, 4, Line{Point{0, 3}, Point{3, 3}}, v), "vline tie: higher start wins");
    t.expect(!run_beats(Axis::Vertical, 4, Line{Point{6, 2}, Point{9, 2}}, v), "vline tie: lower start loses");
    t.expect(run_beats(Axis::Vertical, 5, Line{Point{9, 4}, Point{13, 4}}, v), "longer run always wins");
    t.expect(!run_beats(Axis::Vertical, 3, Line{Point{0, 0}, Point{2, 0}}, v), "shorter run never wins");

    SegmentOracle h;
    h.run_cells = 3;
    h.longest = Line{Point{1, 4}, Point{1, 6}};
    t.expect(!run_beats(Axis::Horizontal, 3, Line{Point{2, 0}, Point{2, 2}}, h), "hline tie keeps the earlier row");

    // Two equally long columns: col 1 rows 5..8 and col 3 rows 0..3.
    Bitmap bmp(BitmapSize{5, 10});
    bmp.fill_col(1, 5, 9);
    bmp.fill_col(3, 0, 4);
    int cells = 0;
    t.expect(to_wire(first_longest_run(bmp, Axis::Vertical, &cells)) == "0 3 3 3" && cells == 4,
             "scan reports the higher of two equal columns");

    // Seeded grids hit real ties; the oracle must agree with the scan there too.
    int ties = 0;
    for (uint64_t seed = 1; seed <= 400; ++seed) {
        RandomSource rng(seed);
        const SegmentSynthesis s = synthesize_vlines(BitmapSize{12, 30}, rng);
        int equal = 0;
        for (const AxisSegments& lane : s.lanes) {
            equal += (s.oracle.found() && lane.longest_cells() == s.oracle.run_cells) ? 1 : 0;
        }
        if (equal < 2) continue;
        ++ties;
        int scanned_cells = 0;
        const Line scanned = first_longest_run(s.bitmap, Axis::Vertical, &scanned_cells);
        t.expect(scanned == s.oracle.longest, "tied vline oracle, seed " + std::to_string(seed));
    }
    t.expect(ties > 0, "seeded vline grids contain ties");
    return t.finish();
}

// ============================================================================
// TEST 10: square synthesizer
// ============================================================================

inline TestResult test_square_invariants() {
    CheckList t("Square invariants");
    t.expect(max_square_side(BitmapSize{2, 2}) == 1, "cap clamps to 1");
    t.expect(max_square_side(BitmapSize{40, 12}) == 3, "cap is min/4");

    for (const SeedEntry& e : get_seed_corpus()) {
        for (uint64_t k = 0; k < 8; ++k) {
            RandomSource rng(e.seed * 17 + k);
            const BitmapSize size{e.width, e.height};
            const SquareSynthesis s = synthesize_squares(size, rng);
            const std::string where = std::string(e.desc) + " k=" + std::to_string(k);

            t.expect(static_cast<int>(s.stamped.size()) >= kMinSquares &&
                     static_cast<int>(s.stamped.size()) <= kMaxSquares, "1..10 squares " + where);
            t.expect(s.oracle.inside(size), "oracle inside the grid " + where);
            bool oracle_stamped = false;
            for (const Square& sq : s.stamped) {
                t.expect(sq.inside(size) && sq.side() <= max_square_side(size), "stamp fits the cap " + where);
                t.expect(!square_beats(sq, s.oracle), "no stamp beats the oracle " + where);
                oracle_stamped = oracle_stamped || sq == s.oracle;
            }
            t.expect(oracle_stamped, "oracle is one of the stamps " + where);

            bool solid = true;
            for (int r = s.oracle.top_left.row; r <= s.oracle.bottom_right.row; ++r) {
                for (int c = s.oracle.top_left.col; c <= s.oracle.bottom_right.col; ++c) {
                    solid = solid && s.bitmap.at(r, c) != 0;
                }
            }
            t.expect(solid, "oracle footprint is set " + where);
            t.expect(s.wire() == to_wire(s.oracle), "wire " + where);
        }
    }
    return t.finish();
}

inline TestResult test_square_unit_cells() {
    CheckList t("Square 4x4 unit cells");
    for (uint64_t seed = 1; seed <= 50; ++seed) {
        RandomSource rng(seed);
        const SquareSynthesis s = synthesize_squares(BitmapSize{4, 4}, rng);
        Point smallest{4, 4};
        for (const Square& sq : s.stamped) {
            t.expect(sq.side() == 1, "unit square, seed " + std::to_string(seed));
            const Point p = sq.top_left;
            if (p.row < smallest.row || (p.row == smallest.row && p.col < smallest.col)) {
                smallest = p;
            }
        }
        t.expect(s.oracle.side() == 1 && s.oracle.top_left == smallest,
                 "lexicographically smallest cell wins, seed " + std::to_string(seed));
    }
    return t.finish();
}

// ============================================================================
// TEST 11: fixture facade writes what it renders
// ============================================================================

inline TestResult test_generate_fixture_file() {
    CheckList t("Fixture facade file");
    const std::string dir = make_temp_dir("facade");
    FixtureOptions opts{};
    opts.fuzz_whitespace = true;

    for (QueryKind q : kAllQueries) {
        RandomSource a(4242);
        RandomSource b(4242);
        Fixture fixture;
        std::string err;
        const bool ok = generate_fixture(q, BitmapSize{12, 9}, opts, a, dir, fixture, &err);
        t.expect(ok, std::string("generate ") + to_string(q) + ": " + err);
        if (!ok) continue;
        const RenderedFixture rendered = render_fixture(q, BitmapSize{12, 9}, opts, b);
        t.expect(read_file(fixture.path) == rendered.text, std::string("file content ") + to_string(q));
        t.expect(fixture.expected_stdout == rendered.expected_stdout, std::string("expected stdout ") + to_string(q));
        const std::string name = std::filesystem::path(fixture.path).filename().string();
        t.expect(name.rfind(std::string("bmp_") + to_string(q) + "_", 0) == 0, "file name prefix " + name);
    }

    RandomSource rng(1);
    Fixture f;
    std::string err;
    t.expect(!generate_fixture(QueryKind::Test, BitmapSize{0, 4}, opts, rng, dir, f, &err) && !err.empty(),
             "zero size is rejected");

    RandomSource v(3);
    const RenderedFixture plain = render_fixture(QueryKind::Test, BitmapSize{5, 5}, FixtureOptions{}, v);
    t.expect(plain.valid && plain.expected_stdout == "Valid", "validity off always answers Valid");

    remove_temp_dir(dir);
    return t.finish();
}

} // namespace figfuzz_testy
