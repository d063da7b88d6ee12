/**
 * @file source_tree.cpp
 * @brief Pre-order traversal and marker-aware printing of source trees
 */

#include "recon/source_tree.hpp"

#include <ranges>
#include <type_traits>
#include <utility>

namespace recon::tree {

namespace {

[[nodiscard]] std::string fence(const Marker& marker)
{
    return std::visit(
        [](const auto& m) -> std::string {
            using M = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<M, SearchResult> || std::is_same_v<M, ErrorMarkup>) {
                return "{{" + m.id + "}}";
            } else if constexpr (std::is_same_v<M, Generated> || std::is_same_v<M, Other>) {
                return {};
            } else {
                static_assert(sizeof(M) == 0, "unhandled marker kind");
            }
        },
        marker);
}

struct PrintFrame
{
    const TreeNode* node;
    bool opened;
};

}  // namespace

ChildNodes::~ChildNodes()
{
    // Hoist every descendant into one flat list so each node is destroyed
    // with an empty child list.
    std::vector<TreeNode> detached;
    for (auto& child : *this) {
        for (auto& grandchild : child.children) {
            detached.push_back(std::move(grandchild));
        }
        child.children.clear();
    }
    while (!detached.empty()) {
        TreeNode node = std::move(detached.back());
        detached.pop_back();
        for (auto& child : node.children) {
            detached.push_back(std::move(child));
        }
        node.children.clear();
    }
}

const std::string& marker_id(const Marker& marker) noexcept
{
    return std::visit([](const auto& m) -> const std::string& { return m.id; }, marker);
}

bool visit_preorder(const TreeNode& root, const NodeVisitor& visitor)
{
    std::vector<const TreeNode*> pending{&root};
    while (!pending.empty()) {
        const TreeNode* node = pending.back();
        pending.pop_back();
        if (!visitor(*node)) {
            return false;
        }
        for (const auto& child : node->children | std::views::reverse) {
            pending.push_back(&child);
        }
    }
    return true;
}

std::string FencedMarkerPrinter::before_syntax(const Marker& marker) const
{
    return fence(marker);
}

std::string FencedMarkerPrinter::after_syntax(const Marker& marker) const
{
    return fence(marker);
}

std::string PlainMarkerPrinter::before_syntax(const Marker& /*marker*/) const
{
    return {};
}

std::string PlainMarkerPrinter::after_syntax(const Marker& /*marker*/) const
{
    return {};
}

std::string print_tree(const TreeNode& root, const MarkerPrinter& printer)
{
    std::string out;
    std::vector<PrintFrame> stack{
        {.node = &root, .opened = false}
    };
    while (!stack.empty()) {
        PrintFrame& frame = stack.back();
        const TreeNode* node = frame.node;
        if (frame.opened) {
            for (const auto& marker : node->markers | std::views::reverse) {
                out += printer.after_syntax(marker);
            }
            stack.pop_back();
            continue;
        }
        frame.opened = true;
        for (const auto& marker : node->markers) {
            out += printer.before_syntax(marker);
        }
        out += node->text;
        // frame is invalidated by the pushes below
        for (const auto& child : node->children | std::views::reverse) {
            stack.push_back({.node = &child, .opened = false});
        }
    }
    return out;
}

}  // namespace recon::tree
