#pragma once

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "../config/run_config.h"
#include "runtime_runner.h"

namespace figfuzz::harness {

enum class Align {
    Left,
    Right,
    Center
};

struct ColumnSpec {
    std::string header;
    Align align = Align::Right;
};

inline std::string pad_cell(const std::string& text, size_t width, Align align) {
    if (text.size() >= width) {
        return text;
    }
    const size_t gap = width - text.size();
    if (align == Align::Left) {
        return text + std::string(gap, ' ');
    }
    if (align == Align::Right) {
        return std::string(gap, ' ') + text;
    }
    const size_t left_pad = gap / 2;
    return std::string(left_pad, ' ') + text + std::string(gap - left_pad, ' ');
}

inline std::string render_table(const std::vector<ColumnSpec>& cols, const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths(cols.size(), 0);
    for (size_t i = 0; i < cols.size(); ++i) {
        widths[i] = cols[i].header.size();
    }
    for (const auto& row : rows) {
        for (size_t i = 0; i < cols.size() && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    std::string separator = "+";
    for (size_t w : widths) {
        separator += std::string(w + 2, '-') + "+";
    }

    std::ostringstream out;
    out << separator << '\n' << '|';
    for (size_t i = 0; i < cols.size(); ++i) {
        out << ' ' << pad_cell(cols[i].header, widths[i], Align::Center) << " |";
    }
    out << '\n' << separator << '\n';
    for (const auto& row : rows) {
        out << '|';
        for (size_t i = 0; i < cols.size(); ++i) {
            const std::string cell = (i < row.size()) ? row[i] : "";
            out << ' ' << pad_cell(cell, widths[i], cols[i].align) << " |";
        }
        out << '\n';
    }
    out << separator;
    return out.str();
}

inline std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

inline std::string render_run_summary(const HarnessRunConfig& cfg, const HarnessRunResult& result) {
    std::ostringstream out;
    out << "=== Run Summary ===\n";
    out << "Mode: " << to_string(result.mode) << "\n";
    out << "Seed: " << result.seed << "\n";
    out << "Trials: " << result.trials_run << " / " << cfg.trials << "\n";
    out << "Random validity: " << (cfg.random_validity ? "on" : "off")
        << ", whitespace fuzz: " << (cfg.fuzz_whitespace ? "on" : "off") << "\n";
    if (result.aborted()) {
        out << "Aborted: " << to_string(result.fatal) << " (" << result.fatal_reason << ")\n";
    }

    const std::vector<ColumnSpec> cols = {
        {"query", Align::Left},
        {"runs"},
        {"pass"},
        {"fail"},
        {"review ok"},
        {"review no"},
        {"proc fail"},
        {"avg ms"},
        {"min ms"},
        {"max ms"},
    };
    std::vector<std::vector<std::string>> rows;
    for (QueryKind q : cfg.queries) {
        const QueryStats& s = result.stats(q);
        rows.push_back({
            to_string(q),
            std::to_string(s.trials),
            std::to_string(s.passed),
            std::to_string(s.failed),
            std::to_string(s.reviewed_accepted),
            std::to_string(s.reviewed_rejected),
            std::to_string(s.process_failures),
            format_fixed(s.avg_ms(), 3),
            format_fixed(s.min_ms, 3),
            format_fixed(s.max_ms, 3),
        });
    }
    out << render_table(cols, rows) << "\n";
    out << "Elapsed: " << format_fixed(result.elapsed_s, 2) << "s\n";
    return out.str();
}

} // namespace figfuzz::harness
