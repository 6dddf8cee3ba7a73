//Author copyright Marcin Matysek (Rewertyn)
#pragma once

#include <cstdlib>
#include <ostream>
#include <sstream>
#include <string>

namespace figfuzz {

struct BitmapSize {
    int width = 0;
    int height = 0;

    bool is_valid() const {
        return width > 0 && height > 0;
    }
};

inline bool operator==(const BitmapSize& a, const BitmapSize& b) {
    return a.width == b.width && a.height == b.height;
}

struct Point {
    int row = 0;
    int col = 0;

    bool inside(const BitmapSize& size) const {
        return row >= 0 && col >= 0 && row < size.height && col < size.width;
    }
};

inline bool operator==(const Point& a, const Point& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Point& a, const Point& b) {
    return !(a == b);
}

// Axis aligned: an hline keeps its row, a vline keeps its column.
// Length is the coordinate difference, so a single cell line has length 0.
struct Line {
    Point begin;
    Point end;

    int length() const {
        return std::abs(end.row - begin.row) + std::abs(end.col - begin.col);
    }

    bool is_horizontal() const {
        return begin.row == end.row;
    }

    bool is_vertical() const {
        return begin.col == end.col;
    }
};

inline bool operator==(const Line& a, const Line& b) {
    return a.begin == b.begin && a.end == b.end;
}

struct Square {
    Point top_left;
    Point bottom_right;

    int side() const {
        return bottom_right.row - top_left.row + 1;
    }

    bool inside(const BitmapSize& size) const {
        return top_left.inside(size) && bottom_right.inside(size) &&
               bottom_right.row - top_left.row == bottom_right.col - top_left.col &&
               side() >= 1;
    }

    bool covers(int row, int col) const {
        return row >= top_left.row && row <= bottom_right.row &&
               col >= top_left.col && col <= bottom_right.col;
    }
};

inline bool operator==(const Square& a, const Square& b) {
    return a.top_left == b.top_left && a.bottom_right == b.bottom_right;
}

inline Square make_square(int top, int left, int side) {
    return Square{Point{top, left}, Point{top + side - 1, left + side - 1}};
}

// Larger side wins, then smaller top row, then smaller left column.
inline bool square_beats(const Square& candidate, const Square& current) {
    if (candidate.side() != current.side()) {
        return candidate.side() > current.side();
    }
    if (candidate.top_left.row != current.top_left.row) {
        return candidate.top_left.row < current.top_left.row;
    }
    return candidate.top_left.col < current.top_left.col;
}

// ============================================================================
// WIRE FORMAT
// Row-major, inclusive cells: "<begin.row> <begin.col> <end.row> <end.col>".
// This is the order the searcher prints (start.y start.x end.y end.x).
// ============================================================================
inline std::string to_wire(const Point& begin, const Point& end) {
    std::ostringstream out;
    out << begin.row << ' ' << begin.col << ' ' << end.row << ' ' << end.col;
    return out.str();
}

inline std::string to_wire(const Line& line) {
    return to_wire(line.begin, line.end);
}

inline std::string to_wire(const Square& square) {
    return to_wire(square.top_left, square.bottom_right);
}

inline const char* not_found_wire() {
    return "Not found";
}

inline std::ostream& operator<<(std::ostream& out, const Point& p) {
    return out << "(" << p.row << "," << p.col << ")";
}

inline std::ostream& operator<<(std::ostream& out, const Line& l) {
    return out << l.begin << "->" << l.end;
}

inline std::ostream& operator<<(std::ostream& out, const Square& s) {
    return out << s.top_left << "->" << s.bottom_right;
}

} // namespace figfuzz
