#pragma once

/**
 * @file source_tree.hpp
 * @brief Source snapshots, markers, pre-order traversal and printing
 */

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace recon::tree {

// ============================================================================
// Markers
// ============================================================================

/// Informational highlight left by a search recipe
struct SearchResult
{
    std::string id;
    std::optional<std::string> description;
};

/// Failure recorded by the engine while transforming the marked node
struct ErrorMarkup
{
    std::string id;
    std::string message;
    std::string detail;
};

/// The source was machine-generated
struct Generated
{
    std::string id;
};

/// Engine bookkeeping with no meaning for reporting
struct Other
{
    std::string id;
    std::string type;
};

using Marker = std::variant<SearchResult, ErrorMarkup, Generated, Other>;

[[nodiscard]] const std::string& marker_id(const Marker& marker) noexcept;

// ============================================================================
// Trees
// ============================================================================

struct TreeNode;

/**
 * @brief Ordered children of a TreeNode.
 *
 * Destroying a subtree releases its descendants from an explicit work list,
 * so the depth of a tree never bounds the call stack on teardown.
 */
class ChildNodes : public std::vector<TreeNode>
{
public:
    using std::vector<TreeNode>::vector;

    ChildNodes() = default;
    ChildNodes(const ChildNodes&) = default;
    ChildNodes(ChildNodes&&) noexcept = default;
    ChildNodes& operator=(const ChildNodes&) = default;
    ChildNodes& operator=(ChildNodes&&) noexcept = default;
    ~ChildNodes();
};

/**
 * @brief A node of a transformed source tree.
 *
 * Printing a node emits the open token of each marker, the node text, the
 * children in order, then the close token of each marker in reverse order.
 */
struct TreeNode
{
    std::string text;
    std::vector<Marker> markers;
    ChildNodes children;
};

/// First marker of type M attached directly to node, or nullptr
template <typename M>
[[nodiscard]] const M* find_marker(const TreeNode& node) noexcept
{
    for (const auto& marker : node.markers) {
        if (const auto* found = std::get_if<M>(&marker)) {
            return found;
        }
    }
    return nullptr;
}

/// One file at one point in time; source_path is relative to the project root
struct SourceSnapshot
{
    std::filesystem::path source_path;
    TreeNode tree;
};

/// Visitor callback; returning false ends the traversal
using NodeVisitor = std::function<bool(const TreeNode&)>;

/**
 * Visit every node of the tree in pre-order.
 * Iterative, so deep trees do not exhaust the call stack.
 * @return false when the visitor stopped the traversal early
 */
bool visit_preorder(const TreeNode& root, const NodeVisitor& visitor);

// ============================================================================
// Printing
// ============================================================================

class MarkerPrinter
{
public:
    virtual ~MarkerPrinter() = default;

    [[nodiscard]] virtual std::string before_syntax(const Marker& marker) const = 0;
    [[nodiscard]] virtual std::string after_syntax(const Marker& marker) const = 0;
};

/**
 * Only retains output for SearchResult and ErrorMarkup markers, as "{{id}}"
 * on both sides of the marked node. Every other marker prints nothing.
 */
class FencedMarkerPrinter final : public MarkerPrinter
{
public:
    [[nodiscard]] std::string before_syntax(const Marker& marker) const override;
    [[nodiscard]] std::string after_syntax(const Marker& marker) const override;
};

/// Prints no marker at all: the file content as it is written to disk
class PlainMarkerPrinter final : public MarkerPrinter
{
public:
    [[nodiscard]] std::string before_syntax(const Marker& marker) const override;
    [[nodiscard]] std::string after_syntax(const Marker& marker) const override;
};

[[nodiscard]] std::string print_tree(const TreeNode& root, const MarkerPrinter& printer);

}  // namespace recon::tree
