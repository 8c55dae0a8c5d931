#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace fw::protocols::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // clamp with "..." in the middle (paths, hashes)
};

// Plain-text table for terminal output. The last column gives up width first.
class Table {
public:
    explicit Table(std::vector<Column> cols, int term_width = 0)
        : cols_(std::move(cols)), term_width_(term_width) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const auto width = columnWidths();

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> headers;
        std::vector<std::string> rules;
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            headers.push_back(cols_[i].header);
            rules.emplace_back(width[i], '-');
        }

        emitLine(out, headers, width);
        emitLine(out, rules, width);
        for (const auto& r : rows_) emitLine(out, r, width);

        return out;
    }

private:
    static constexpr std::size_t PAD_LEFT = 2;
    static constexpr std::size_t GAP = 2;
    static constexpr int FALLBACK_TERM = 100;

    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
    int term_width_ = 0;

    [[nodiscard]] std::vector<std::size_t> columnWidths() const {
        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);

        for (std::size_t i = 0; i < ncol; ++i) {
            width[i] = std::max(cols_[i].min, cols_[i].header.size());
            for (const auto& r : rows_) width[i] = std::max(width[i], r[i].size());
            width[i] = std::clamp(width[i], cols_[i].min, std::max(cols_[i].min, cols_[i].max));
        }

        const auto budget = static_cast<std::size_t>(term_width_ > 0 ? term_width_ : FALLBACK_TERM);
        std::size_t total = PAD_LEFT + GAP * (ncol - 1);
        for (const auto w : width) total += w;

        const std::size_t last = ncol - 1;
        while (total > budget && width[last] > cols_[last].min) {
            --width[last];
            --total;
        }
        return width;
    }

    void emitLine(std::string& out, const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        out.append(PAD_LEFT, ' ');
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out.append(GAP, ' ');
            const auto cell = clamp(cells[i], width[i], cols_[i].ellipsize_middle);
            if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
            else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
        }
        while (!out.empty() && out.back() == ' ') out.pop_back();
        out += '\n';
    }

    static std::string clamp(const std::string& s, const std::size_t width, const bool middle) {
        if (s.size() <= width) return s;
        if (!middle || width <= 3) return s.substr(0, width);
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
    }
};

}
