/**
 * @file diff.cpp
 * @brief Line-based unified diff (LCS edit script, git-style hunks)
 */

#include "recon/diff.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <vector>

namespace recon::tree {

namespace {

enum class EditKind : char { kKeep = ' ', kRemove = '-', kInsert = '+' };

struct Edit
{
    EditKind kind;
    std::string_view line;  ///< Includes the trailing '\n' when present
};

struct Hunk
{
    std::size_t begin;  ///< First edit index
    std::size_t end;    ///< One past the last edit index
};

[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const std::size_t newline = text.find('\n', start);
        const std::size_t stop = newline == std::string_view::npos ? text.size() : newline + 1;
        lines.push_back(text.substr(start, stop - start));
        start = stop;
    }
    return lines;
}

// Largest LCS table built for the changed middle of a file (64 MiB)
constexpr std::size_t kMaxLcsCells = std::size_t{1} << 24;

// Common prefix and suffix are matched directly; only the middle goes
// through the quadratic LCS table. A middle too large for the table is
// emitted as one block of removals followed by one block of insertions.
[[nodiscard]] std::vector<Edit> compute_edits(const std::vector<std::string_view>& before,
                                              const std::vector<std::string_view>& after)
{
    const std::size_t n = before.size();
    const std::size_t m = after.size();
    std::size_t prefix = 0;
    while (prefix < n && prefix < m && before[prefix] == after[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < n - prefix && suffix < m - prefix
           && before[n - 1 - suffix] == after[m - 1 - suffix]) {
        ++suffix;
    }

    const std::size_t rows = n - prefix - suffix;
    const std::size_t cols = m - prefix - suffix;

    std::vector<Edit> edits;
    edits.reserve(n + m);
    for (std::size_t k = 0; k < prefix; ++k) {
        edits.push_back({.kind = EditKind::kKeep, .line = before[k]});
    }
    if (rows + 1 > kMaxLcsCells / (cols + 1)) {
        for (std::size_t i = 0; i < rows; ++i) {
            edits.push_back({.kind = EditKind::kRemove, .line = before[prefix + i]});
        }
        for (std::size_t j = 0; j < cols; ++j) {
            edits.push_back({.kind = EditKind::kInsert, .line = after[prefix + j]});
        }
    } else {
        std::vector<std::uint32_t> lcs((rows + 1) * (cols + 1), 0);
        const auto at = [cols](std::size_t i, std::size_t j) { return i * (cols + 1) + j; };
        for (std::size_t i = rows; i-- > 0;) {
            for (std::size_t j = cols; j-- > 0;) {
                if (before[prefix + i] == after[prefix + j]) {
                    lcs[at(i, j)] = lcs[at(i + 1, j + 1)] + 1;
                } else {
                    lcs[at(i, j)] = std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
                }
            }
        }

        std::size_t i = 0;
        std::size_t j = 0;
        while (i < rows || j < cols) {
            if (i < rows && j < cols && before[prefix + i] == after[prefix + j]) {
                edits.push_back({.kind = EditKind::kKeep, .line = before[prefix + i]});
                ++i;
                ++j;
            } else if (i < rows && (j == cols || lcs[at(i + 1, j)] >= lcs[at(i, j + 1)])) {
                edits.push_back({.kind = EditKind::kRemove, .line = before[prefix + i]});
                ++i;
            } else {
                edits.push_back({.kind = EditKind::kInsert, .line = after[prefix + j]});
                ++j;
            }
        }
    }
    for (std::size_t k = n - suffix; k < n; ++k) {
        edits.push_back({.kind = EditKind::kKeep, .line = before[k]});
    }
    return edits;
}

[[nodiscard]] std::vector<Hunk> group_hunks(const std::vector<Edit>& edits, std::size_t context)
{
    std::vector<Hunk> hunks;
    for (std::size_t k = 0; k < edits.size(); ++k) {
        if (edits[k].kind == EditKind::kKeep) {
            continue;
        }
        const std::size_t begin = k > context ? k - context : 0;
        const std::size_t end = std::min(edits.size(), k + context + 1);
        if (!hunks.empty() && begin <= hunks.back().end) {
            hunks.back().end = end;
        } else {
            hunks.push_back({.begin = begin, .end = end});
        }
    }
    return hunks;
}

[[nodiscard]] std::string format_range(std::size_t lines_before, std::size_t count)
{
    if (count == 0) {
        return std::format("{},0", lines_before);
    }
    if (count == 1) {
        return std::format("{}", lines_before + 1);
    }
    return std::format("{},{}", lines_before + 1, count);
}

void append_line(std::string& out, EditKind kind, std::string_view line)
{
    out += static_cast<char>(kind);
    out += line;
    if (!line.ends_with('\n')) {
        out += "\n\\ No newline at end of file\n";
    }
}

[[nodiscard]] std::string render_hunks(const std::vector<Edit>& edits, std::size_t context)
{
    // Lines of each side that precede edit k
    std::vector<std::size_t> old_before(edits.size() + 1, 0);
    std::vector<std::size_t> new_before(edits.size() + 1, 0);
    for (std::size_t k = 0; k < edits.size(); ++k) {
        old_before[k + 1] = old_before[k] + (edits[k].kind != EditKind::kInsert ? 1 : 0);
        new_before[k + 1] = new_before[k] + (edits[k].kind != EditKind::kRemove ? 1 : 0);
    }

    std::string out;
    for (const auto& hunk : group_hunks(edits, context)) {
        const std::size_t old_count = old_before[hunk.end] - old_before[hunk.begin];
        const std::size_t new_count = new_before[hunk.end] - new_before[hunk.begin];
        out += std::format("@@ -{} +{} @@\n",
                           format_range(old_before[hunk.begin], old_count),
                           format_range(new_before[hunk.begin], new_count));
        for (std::size_t k = hunk.begin; k < hunk.end; ++k) {
            append_line(out, edits[k].kind, edits[k].line);
        }
    }
    return out;
}

}  // namespace

std::string unified_diff(std::string_view before_text,
                         std::string_view after_text,
                         const DiffPaths& paths,
                         std::size_t context)
{
    if (!paths.before && !paths.after) {
        return {};
    }
    const std::string& old_path = paths.before ? *paths.before : *paths.after;
    const std::string& new_path = paths.after ? *paths.after : *paths.before;
    const bool renamed = paths.before && paths.after && old_path != new_path;
    if (paths.before && paths.after && !renamed && before_text == after_text) {
        return {};
    }

    std::string out = std::format("diff --git a/{} b/{}\n", old_path, new_path);
    if (!paths.before) {
        out += "new file mode 100644\n";
    } else if (!paths.after) {
        out += "deleted file mode 100644\n";
    } else if (renamed) {
        out += std::format("rename from {}\nrename to {}\n", old_path, new_path);
    }

    const std::string hunks =
        render_hunks(compute_edits(split_lines(before_text), split_lines(after_text)), context);
    if (hunks.empty()) {
        return out;
    }
    out += paths.before ? std::format("--- a/{}\n", old_path) : std::string("--- /dev/null\n");
    out += paths.after ? std::format("+++ b/{}\n", new_path) : std::string("+++ /dev/null\n");
    out += hunks;
    return out;
}

}  // namespace recon::tree
