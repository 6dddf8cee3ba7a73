// ============================================================================
// FIGSEARCH FUZZ - STUB PROGRAM UNDER TEST
// Plik: stub_figsearch.cpp
// Usage: figsearch_stub <test|hline|vline|square> <bitmap>
//
// Reads fixtures the way the reference loader does (whitespace via isspace,
// positive dimensions, exactly height*width bit characters) and answers with
// the first maximal figure in scan order. Environment switches:
//   FIGFUZZ_STUB_EXIT=<n>          exit with <n> after answering
//   FIGFUZZ_STUB_VERBOSE=1         wordy answer for invalid bitmaps
//   FIGFUZZ_STUB_COLUMN_MAJOR=1    print "col row col row"
//   FIGFUZZ_STUB_SLEEP_MS=<n>      sleep before doing anything
//   FIGFUZZ_STUB_CLOSE_STDOUT=1    close stdout first, then sleep
// ============================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace {

struct StubBitmap {
    int width = 0;
    int height = 0;
    std::vector<char> cells;

    bool at(int r, int c) const {
        return cells[static_cast<size_t>(r) * static_cast<size_t>(width) + static_cast<size_t>(c)] == '1';
    }
};

struct Figure {
    int r0 = 0;
    int c0 = 0;
    int r1 = 0;
    int c1 = 0;
    int size = 0;   // 0 = nothing found
};

int env_int(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (raw == nullptr || *raw == '\0') return fallback;
    char* end = nullptr;
    const long v = std::strtol(raw, &end, 10);
    return (end == raw || *end != '\0') ? fallback : static_cast<int>(v);
}

bool read_dimension(std::istream& in, int& out) {
    long v = 0;
    if (!(in >> v) || v <= 0 || v > 100000) return false;
    out = static_cast<int>(v);
    return true;
}

bool load_bitmap(const char* path, StubBitmap& bmp) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    if (!read_dimension(in, bmp.height) || !read_dimension(in, bmp.width)) return false;

    const size_t expected = static_cast<size_t>(bmp.width) * static_cast<size_t>(bmp.height);
    bmp.cells.reserve(expected);
    char ch = 0;
    while (in.get(ch)) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) continue;
        if (ch != '0' && ch != '1') return false;
        if (bmp.cells.size() == expected) return false;
        bmp.cells.push_back(ch);
    }
    return bmp.cells.size() == expected;
}

Figure longest_hline(const StubBitmap& bmp) {
    Figure best;
    for (int r = 0; r < bmp.height; ++r) {
        int c = 0;
        while (c < bmp.width) {
            if (!bmp.at(r, c)) { ++c; continue; }
            const int begin = c;
            while (c < bmp.width && bmp.at(r, c)) ++c;
            if (c - begin > best.size) best = Figure{r, begin, r, c - 1, c - begin};
        }
    }
    return best;
}

Figure longest_vline(const StubBitmap& bmp) {
    Figure best;
    for (int c = 0; c < bmp.width; ++c) {
        int r = 0;
        while (r < bmp.height) {
            if (!bmp.at(r, c)) { ++r; continue; }
            const int begin = r;
            while (r < bmp.height && bmp.at(r, c)) ++r;
            // Same tie rule as the searcher: longer, then smaller row, then smaller col.
            const bool earlier = best.size > 0 && (begin < best.r0 || (begin == best.r0 && c < best.c0));
            if (r - begin > best.size || (r - begin == best.size && earlier)) {
                best = Figure{begin, c, r - 1, c, r - begin};
            }
        }
    }
    return best;
}

// side[r][c] = side of the largest solid square whose top-left is (r, c).
Figure largest_square(const StubBitmap& bmp) {
    const int w = bmp.width;
    const int h = bmp.height;
    std::vector<int> side(static_cast<size_t>(w + 1) * static_cast<size_t>(h + 1), 0);
    auto at = [&](int r, int c) -> int& { return side[static_cast<size_t>(r) * static_cast<size_t>(w + 1) + static_cast<size_t>(c)]; };
    for (int r = h - 1; r >= 0; --r) {
        for (int c = w - 1; c >= 0; --c) {
            if (bmp.at(r, c)) {
                at(r, c) = 1 + std::min(at(r + 1, c), std::min(at(r, c + 1), at(r + 1, c + 1)));
            }
        }
    }
    Figure best;
    for (int r = 0; r < h; ++r) {
        for (int c = 0; c < w; ++c) {
            const int s = at(r, c);
            if (s > best.size) best = Figure{r, c, r + s - 1, c + s - 1, s};
        }
    }
    return best;
}

void print_figure(const Figure& f) {
    if (f.size == 0) {
        std::cout << "Not found\n";
        return;
    }
    if (env_int("FIGFUZZ_STUB_COLUMN_MAJOR", 0) != 0) {
        std::cout << f.c0 << ' ' << f.r0 << ' ' << f.c1 << ' ' << f.r1 << "\n";
        return;
    }
    std::cout << f.r0 << ' ' << f.c0 << ' ' << f.r1 << ' ' << f.c1 << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (env_int("FIGFUZZ_STUB_CLOSE_STDOUT", 0) != 0) {
        ::close(STDOUT_FILENO);
    }
    const int sleep_ms = env_int("FIGFUZZ_STUB_SLEEP_MS", 0);
    if (sleep_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    }
    if (argc != 3) {
        std::cerr << "usage: figsearch_stub <test|hline|vline|square> <bitmap>\n";
        return 2;
    }

    const std::string query = argv[1];
    StubBitmap bmp;
    const bool valid = load_bitmap(argv[2], bmp);

    if (query == "test") {
        if (valid) {
            std::cout << "Valid\n";
        } else if (env_int("FIGFUZZ_STUB_VERBOSE", 0) != 0) {
            std::cout << "Error: Invalid bitmap, Invalid dims\n";
        } else {
            std::cout << "Invalid\n";
        }
    } else if (!valid) {
        std::cerr << "Invalid bitmap\n";
        return 1;
    } else if (query == "hline") {
        print_figure(longest_hline(bmp));
    } else if (query == "vline") {
        print_figure(longest_vline(bmp));
    } else if (query == "square") {
        print_figure(largest_square(bmp));
    } else {
        std::cerr << "unknown query: " << query << "\n";
        return 2;
    }
    std::cout.flush();
    return env_int("FIGFUZZ_STUB_EXIT", 0);
}
