// ============================================================================
// FIGSEARCH FUZZ - FIXTURE SERIALIZATION
// Module: bitmap_writer.h
// Description: turns a grid into the text fixture read by the searcher:
//              "<height> <width>\n" followed by height rows of width bits.
//              Optional dimension/cell corruption and whitespace fuzzing.
// ============================================================================

#pragma once

#include <array>
#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include "../core/bitmap.h"
#include "../core/random_source.h"

namespace figfuzz::generator {

inline constexpr char kPixelFilled = '1';
inline constexpr char kPixelEmpty = '0';

inline constexpr std::array<char, 6> kFuzzWhitespace = {' ', '\t', '\n', '\v', '\f', '\r'};

// Never whitespace and never a valid bit.
inline constexpr std::string_view kInvalidSymbols = "23456789abcdefxyzXYZ#*-+.,;/";

struct WriterOptions {
    bool corrupt = false;          // dimension/content fuzz
    bool fuzz_whitespace = false;  // SEP and LINE_END resampled per occurrence
};

struct WriteReport {
    BitmapSize declared{};         // what the header claims
    BitmapSize actual{};           // what the body holds
    uint64_t corrupted_cells = 0;
    bool header_altered = false;

    bool valid() const {
        return !header_altered && corrupted_cells == 0 && declared == actual;
    }
};

inline std::string whitespace_run(RandomSource& rng) {
    const int len = rng.uniform_int(1, 10);
    std::string out;
    out.reserve(static_cast<size_t>(len));
    for (int i = 0; i < len; ++i) {
        out.push_back(rng.pick(kFuzzWhitespace));
    }
    return out;
}

class FixtureTextBuilder {
public:
    FixtureTextBuilder(const WriterOptions& opts, RandomSource& rng) : opts_(opts), rng_(rng) {}

    void sep() {
        if (opts_.fuzz_whitespace) {
            out_ += whitespace_run(rng_);
        } else {
            out_.push_back(' ');
        }
    }

    void line_end() {
        if (opts_.fuzz_whitespace) {
            out_ += whitespace_run(rng_);
        } else {
            out_.push_back('\n');
        }
    }

    void append(std::string_view text) {
        out_.append(text.data(), text.size());
    }

    void append(char c) {
        out_.push_back(c);
    }

    void reserve(size_t n) {
        out_.reserve(n);
    }

    std::string take() {
        return std::move(out_);
    }

private:
    const WriterOptions& opts_;
    RandomSource& rng_;
    std::string out_;
};

// Serializes `bmp`. With opts.corrupt each header dimension is, on a fair
// coin, replaced by a value drawn from [0, real value], and each body cell is,
// on a fair coin, replaced by a symbol from kInvalidSymbols.
inline std::string render_bitmap(const Bitmap& bmp, const WriterOptions& opts, RandomSource& rng, WriteReport* report = nullptr) {
    WriteReport local{};
    local.actual = bmp.size();

    int header_height = bmp.height();
    int header_width = bmp.width();
    if (opts.corrupt) {
        if (rng.chance(0.5)) {
            header_height = rng.uniform_int(0, bmp.height());
        }
        if (rng.chance(0.5)) {
            header_width = rng.uniform_int(0, bmp.width());
        }
    }
    local.declared = BitmapSize{header_width, header_height};
    local.header_altered = !(local.declared == local.actual);

    FixtureTextBuilder text(opts, rng);
    text.reserve(static_cast<size_t>(bmp.width()) * static_cast<size_t>(bmp.height()) * 2 + 32);
    text.append(std::to_string(header_height));
    text.sep();
    text.append(std::to_string(header_width));
    text.line_end();

    for (int r = 0; r < bmp.height(); ++r) {
        for (int c = 0; c < bmp.width(); ++c) {
            if (c > 0) {
                text.sep();
            }
            if (opts.corrupt && rng.chance(0.5)) {
                text.append(kInvalidSymbols[static_cast<size_t>(rng.uniform_int(0, static_cast<int>(kInvalidSymbols.size()) - 1))]);
                ++local.corrupted_cells;
                continue;
            }
            text.append(bmp.at(r, c) != 0 ? kPixelFilled : kPixelEmpty);
        }
        text.line_end();
    }

    if (report != nullptr) {
        *report = local;
    }
    return text.take();
}

// Valid-mode payload: every cell independently 1 or 0 with probability 0.5.
inline Bitmap random_bitmap(BitmapSize size, RandomSource& rng) {
    Bitmap bmp(size);
    for (int r = 0; r < size.height; ++r) {
        for (int c = 0; c < size.width; ++c) {
            bmp.set(r, c, rng.chance(0.5) ? 1 : 0);
        }
    }
    return bmp;
}

inline bool write_text_file(const std::string& path, const std::string& content, std::string* err = nullptr) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) {
        if (err != nullptr) *err = "cannot open fixture file for writing: " + path;
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        if (err != nullptr) *err = "short write to fixture file: " + path;
        return false;
    }
    return true;
}

} // namespace figfuzz::generator
