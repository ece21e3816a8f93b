#include <parity/compare/comparator.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace parity::compare {

namespace {

constexpr std::size_t kContext = 3;
// Above this many DP cells the middle section is reported as replaced wholesale.
constexpr std::size_t kMaxCells = std::size_t{4} << 20;

struct Edit {
    char op = ' ';
    std::string_view text;
};

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

auto edit_script(const std::vector<std::string_view>& a, const std::vector<std::string_view>& b)
    -> std::vector<Edit> {
    std::size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }
    const std::size_t n = a.size() - prefix - suffix;
    const std::size_t m = b.size() - prefix - suffix;

    std::vector<Edit> edits;
    edits.reserve(prefix + suffix + n + m);
    for (std::size_t i = 0; i < prefix; ++i) {
        edits.push_back(Edit{.op = ' ', .text = a[i]});
    }

    if (n == 0 || m == 0 || (n + 1) * (m + 1) > kMaxCells) {
        for (std::size_t i = 0; i < n; ++i) {
            edits.push_back(Edit{.op = '-', .text = a[prefix + i]});
        }
        for (std::size_t j = 0; j < m; ++j) {
            edits.push_back(Edit{.op = '+', .text = b[prefix + j]});
        }
    } else {
        // lcs[i][j]: LCS length of a[i..n) and b[j..m) within the middle section.
        std::vector<std::uint32_t> lcs((n + 1) * (m + 1), 0);
        const auto at = [&](std::size_t i, std::size_t j) -> std::uint32_t& {
            return lcs[i * (m + 1) + j];
        };
        for (std::size_t i = n; i-- > 0;) {
            for (std::size_t j = m; j-- > 0;) {
                if (a[prefix + i] == b[prefix + j]) {
                    at(i, j) = at(i + 1, j + 1) + 1;
                } else {
                    at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
                }
            }
        }
        std::size_t i = 0;
        std::size_t j = 0;
        while (i < n && j < m) {
            if (a[prefix + i] == b[prefix + j]) {
                edits.push_back(Edit{.op = ' ', .text = a[prefix + i]});
                ++i;
                ++j;
            } else if (at(i + 1, j) >= at(i, j + 1)) {
                edits.push_back(Edit{.op = '-', .text = a[prefix + i]});
                ++i;
            } else {
                edits.push_back(Edit{.op = '+', .text = b[prefix + j]});
                ++j;
            }
        }
        for (; i < n; ++i) {
            edits.push_back(Edit{.op = '-', .text = a[prefix + i]});
        }
        for (; j < m; ++j) {
            edits.push_back(Edit{.op = '+', .text = b[prefix + j]});
        }
    }

    for (std::size_t i = a.size() - suffix; i < a.size(); ++i) {
        edits.push_back(Edit{.op = ' ', .text = a[i]});
    }
    return edits;
}

auto hunk_range(std::size_t start, std::size_t count) -> std::string {
    // Empty ranges name the line before the hunk, as diff -u does.
    if (count == 0) {
        return fmt::format("{},0", start);
    }
    if (count == 1) {
        return fmt::format("{}", start + 1);
    }
    return fmt::format("{},{}", start + 1, count);
}

}  // namespace

auto line_diff(std::string_view want, std::string_view got) -> std::string {
    auto a = split_lines(want);
    auto b = split_lines(got);
    auto edits = edit_script(a, b);

    std::vector<std::size_t> changes;
    for (std::size_t k = 0; k < edits.size(); ++k) {
        if (edits[k].op != ' ') {
            changes.push_back(k);
        }
    }
    if (changes.empty()) {
        return {};
    }

    // Line offsets in `want` and `got` before each edit.
    std::vector<std::size_t> old_pos(edits.size() + 1, 0);
    std::vector<std::size_t> new_pos(edits.size() + 1, 0);
    for (std::size_t k = 0; k < edits.size(); ++k) {
        old_pos[k + 1] = old_pos[k] + (edits[k].op != '+' ? 1 : 0);
        new_pos[k + 1] = new_pos[k] + (edits[k].op != '-' ? 1 : 0);
    }

    std::string out = "--- want\n+++ got\n";
    std::size_t c = 0;
    while (c < changes.size()) {
        std::size_t first = changes[c];
        std::size_t last = first;
        while (c + 1 < changes.size() && changes[c + 1] - last <= 2 * kContext + 1) {
            ++c;
            last = changes[c];
        }
        ++c;
        std::size_t begin = first > kContext ? first - kContext : 0;
        std::size_t end = std::min(edits.size(), last + 1 + kContext);

        out.append(fmt::format("@@ -{} +{} @@\n",
                               hunk_range(old_pos[begin], old_pos[end] - old_pos[begin]),
                               hunk_range(new_pos[begin], new_pos[end] - new_pos[begin])));
        for (std::size_t k = begin; k < end; ++k) {
            out.push_back(edits[k].op);
            out.append(edits[k].text);
            out.push_back('\n');
        }
    }
    return out;
}

}  // namespace parity::compare
