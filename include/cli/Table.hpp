#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <limits>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace vc::cli {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t max = std::numeric_limits<std::size_t>::max();
    bool ellipsize_middle = false;   // keeps both ends of long paths and ids
};

class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = cols_[i].header.size();
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < ncol; ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        const auto emit = [&](const std::vector<std::string>& cells) {
            out += "  ";
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += "  ";
                const auto cell = clamp(cells[i], width[i], cols_[i].ellipsize_middle);
                if (cols_[i].align == Align::Left) fmt::format_to(std::back_inserter(out), "{:<{}}", cell, width[i]);
                else fmt::format_to(std::back_inserter(out), "{:>{}}", cell, width[i]);
            }
            // no trailing padding on the last column
            while (!out.empty() && out.back() == ' ') out.pop_back();
            out += '\n';
        };

        std::vector<std::string> header;
        header.reserve(ncol);
        for (const auto& c : cols_) header.push_back(c.header);
        emit(header);

        std::vector<std::string> rule;
        rule.reserve(ncol);
        for (const auto w : width) rule.emplace_back(w, '-');
        emit(rule);

        for (const auto& r : rows_) emit(r);
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    static std::string clamp(const std::string& s, const std::size_t width, const bool middle) {
        if (s.size() <= width) return s;
        if (width <= 3) return s.substr(0, width);
        if (!middle) return s.substr(0, width - 3) + "...";
        const std::size_t keep = width - 3;
        const std::size_t left = keep / 2;
        return s.substr(0, left) + "..." + s.substr(s.size() - (keep - left));
    }
};

}
