// ============================================================================
// FIGSEARCH FUZZ - SQUARE SYNTHESIZER
// Module: square_synthesizer.h
// Description: stamps 1..10 random solid squares onto an empty grid and
//              keeps the winner by (side desc, row asc, col asc).
//              Overlapping stamps are not merged: the expected answer is the
//              largest stamped square, not the largest connected one.
// ============================================================================

#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include "../core/bitmap.h"
#include "../core/geometry.h"
#include "../core/random_source.h"

namespace figfuzz::generator {

inline constexpr int kMinSquares = 1;
inline constexpr int kMaxSquares = 10;

struct SquareSynthesis {
    Bitmap bitmap;
    std::vector<Square> stamped;
    Square oracle{};

    std::string wire() const {
        return to_wire(oracle);
    }
};

// Side is capped at a quarter of the shorter dimension, never below 1.
inline int max_square_side(BitmapSize size) {
    return std::max(1, std::min(size.width, size.height) / 4);
}

inline SquareSynthesis synthesize_squares(BitmapSize size, RandomSource& rng) {
    SquareSynthesis out;
    out.bitmap = Bitmap(size);
    if (!size.is_valid()) {
        return out;
    }

    const int count = rng.uniform_int(kMinSquares, kMaxSquares);
    const int side_cap = max_square_side(size);
    out.stamped.reserve(static_cast<size_t>(count));

    for (int i = 0; i < count; ++i) {
        const int side = rng.uniform_int(1, side_cap);
        const int top = rng.uniform_int(0, size.height - side);
        const int left = rng.uniform_int(0, size.width - side);
        const Square sq = make_square(top, left, side);
        out.bitmap.stamp(sq);
        if (out.stamped.empty() || square_beats(sq, out.oracle)) {
            out.oracle = sq;
        }
        out.stamped.push_back(sq);
    }
    return out;
}

} // namespace figfuzz::generator
