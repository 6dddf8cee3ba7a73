#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

#include "geometry.h"

namespace figfuzz {

// Row-major grid of 0/1 cells. Dimensions are fixed at construction.
class Bitmap {
public:
    Bitmap() = default;

    explicit Bitmap(BitmapSize size)
        : size_(size),
          cells_(static_cast<size_t>(std::max(0, size.width)) * static_cast<size_t>(std::max(0, size.height)), 0) {}

    const BitmapSize& size() const {
        return size_;
    }

    int width() const {
        return size_.width;
    }

    int height() const {
        return size_.height;
    }

    uint8_t at(int row, int col) const {
        return cells_[index(row, col)];
    }

    void set(int row, int col, uint8_t bit) {
        cells_[index(row, col)] = bit != 0 ? 1 : 0;
    }

    void fill_row(int row, int col_begin, int col_end) {
        for (int c = col_begin; c < col_end; ++c) {
            set(row, c, 1);
        }
    }

    void fill_col(int col, int row_begin, int row_end) {
        for (int r = row_begin; r < row_end; ++r) {
            set(r, col, 1);
        }
    }

    void stamp(const Square& sq) {
        for (int r = sq.top_left.row; r <= sq.bottom_right.row; ++r) {
            fill_row(r, sq.top_left.col, sq.bottom_right.col + 1);
        }
    }

    uint64_t count_set() const {
        return static_cast<uint64_t>(std::count(cells_.begin(), cells_.end(), static_cast<uint8_t>(1)));
    }

    const std::vector<uint8_t>& cells() const {
        return cells_;
    }

private:
    size_t index(int row, int col) const {
        return static_cast<size_t>(row) * static_cast<size_t>(size_.width) + static_cast<size_t>(col);
    }

    BitmapSize size_{};
    std::vector<uint8_t> cells_;
};

} // namespace figfuzz
