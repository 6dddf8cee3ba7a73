// ============================================================================
// FIGSEARCH FUZZ - SEGMENT SYNTHESIZER (hline / vline)
// Module: segment_synthesizer.h
// Description: fills every row (or column) with disjoint random runs of set
//              bits and tracks the longest run while generating, so the
//              expected answer is known before the searcher ever runs.
// ============================================================================

#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "../core/bitmap.h"
#include "../core/geometry.h"
#include "../core/random_source.h"

namespace figfuzz::generator {

enum class Axis {
    Horizontal,
    Vertical,
};

// Half-open run [begin, end) along the axis. begin == end is an empty run.
struct Segment {
    int begin = 0;
    int end = 0;

    int cells() const {
        return end - begin;
    }
};

struct AxisSegments {
    int index = 0;      // row for hline, column for vline
    int maxlen = 0;
    std::vector<Segment> segments;
    int longest = -1;   // position in `segments`, -1 when none

    int longest_cells() const {
        return longest < 0 ? 0 : segments[static_cast<size_t>(longest)].cells();
    }
};

struct SegmentOracle {
    Line longest{};
    int run_cells = 0;  // 0 when the grid holds no set cell on this axis

    bool found() const {
        return run_cells > 0;
    }

    std::string wire() const {
        return found() ? to_wire(longest) : std::string(not_found_wire());
    }
};

struct SegmentSynthesis {
    Axis axis = Axis::Horizontal;
    Bitmap bitmap;
    std::vector<AxisSegments> lanes;
    SegmentOracle oracle;
};

// Upper bound for the per-lane maximum run length. Columns are capped at a
// third of the extent.
inline int maxlen_bound(Axis axis, int extent) {
    return axis == Axis::Horizontal ? extent : extent / 3;
}

inline AxisSegments synthesize_lane(int index, int extent, int bound, RandomSource& rng) {
    AxisSegments lane;
    lane.index = index;
    if (extent <= 0) {
        return lane;
    }

    lane.maxlen = rng.uniform_int(0, std::max(0, bound));
    int cursor = 0;
    while (cursor + lane.maxlen <= extent) {
        const int begin = rng.uniform_int(cursor, cursor + lane.maxlen);
        const int end = rng.uniform_int(begin, std::min(begin + lane.maxlen, extent));
        lane.segments.push_back(Segment{begin, end});
        if (lane.longest < 0 || (end - begin) > lane.longest_cells()) {
            lane.longest = static_cast<int>(lane.segments.size()) - 1;
        }
        cursor = end + 1;
    }
    return lane;
}

// The stored Line uses inclusive cells, so the trailing coordinate is the
// half-open end minus one.
inline Line lane_line(Axis axis, int index, const Segment& seg) {
    if (axis == Axis::Horizontal) {
        return Line{Point{index, seg.begin}, Point{index, seg.end - 1}};
    }
    return Line{Point{seg.begin, index}, Point{seg.end - 1, index}};
}

// Longer run wins. Rows are walked in the searcher's own order, so an hline
// tie keeps the first run seen. Columns are not: a vline tie goes to the
// smaller start (row, col), which is what the searcher prints.
inline bool run_beats(Axis axis, int cells, const Line& candidate, const SegmentOracle& best) {
    if (cells != best.run_cells) {
        return cells > best.run_cells;
    }
    if (axis == Axis::Horizontal || !best.found()) {
        return false;
    }
    if (candidate.begin.row != best.longest.begin.row) {
        return candidate.begin.row < best.longest.begin.row;
    }
    return candidate.begin.col < best.longest.begin.col;
}

inline SegmentSynthesis synthesize_segments(Axis axis, BitmapSize size, RandomSource& rng) {
    SegmentSynthesis out;
    out.axis = axis;
    out.bitmap = Bitmap(size);

    const int lanes = axis == Axis::Horizontal ? size.height : size.width;
    const int extent = axis == Axis::Horizontal ? size.width : size.height;
    const int bound = maxlen_bound(axis, extent);
    out.lanes.reserve(static_cast<size_t>(std::max(0, lanes)));

    for (int i = 0; i < lanes; ++i) {
        AxisSegments lane = synthesize_lane(i, extent, bound, rng);
        const int local = lane.longest_cells();
        if (local > 0) {
            const Line candidate = lane_line(axis, i, lane.segments[static_cast<size_t>(lane.longest)]);
            if (run_beats(axis, local, candidate, out.oracle)) {
                out.oracle.run_cells = local;
                out.oracle.longest = candidate;
            }
        }
        out.lanes.push_back(std::move(lane));
    }

    for (const AxisSegments& lane : out.lanes) {
        for (const Segment& seg : lane.segments) {
            if (seg.cells() <= 0) continue;
            if (axis == Axis::Horizontal) {
                out.bitmap.fill_row(lane.index, seg.begin, seg.end);
            } else {
                out.bitmap.fill_col(lane.index, seg.begin, seg.end);
            }
        }
    }
    return out;
}

inline SegmentSynthesis synthesize_hlines(BitmapSize size, RandomSource& rng) {
    return synthesize_segments(Axis::Horizontal, size, rng);
}

inline SegmentSynthesis synthesize_vlines(BitmapSize size, RandomSource& rng) {
    return synthesize_segments(Axis::Vertical, size, rng);
}

} // namespace figfuzz::generator
