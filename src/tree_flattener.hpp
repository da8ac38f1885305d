#pragma once

#include "interfaces/i_hierarchy_node.hpp"
#include "row_binding.hpp"
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor {

using ChildrenOf = std::function<std::vector<IHierarchyNode*>(const IHierarchyNode&)>;

// Which children a row kind exposes and how it can be sorted. Rendering is
// the other half of the pair and lives with the renderer.
struct RowStrategy {
    ChildrenOf children_of;
    std::vector<std::string> sort_attributes;
    std::string primary_field = "about";
};

// Every child, sortable by the given attributes
[[nodiscard]] RowStrategy full_tree_strategy(std::vector<std::string> sort_attributes);

// Identity (node name) -> per-row UI state. Owned by the controller and
// moved through each flatten.
using BindingTable = std::unordered_map<std::string, std::unique_ptr<RowBinding>>;

struct FlattenResult {
    std::vector<RowBinding*> rows;  // Points into table
    BindingTable table;
};

class TreeFlattener {
public:
    explicit TreeFlattener(RowStrategy strategy);

    // Depth-first pre-order. Without a pattern, children are visited only
    // below expanded rows; with one, every node whose primary field matches
    // is listed regardless of expansion.
    // Bindings of live nodes that are not listed this pass are carried over.
    // Throws FilterError if the pattern does not compile. If anything throws,
    // `previous` still holds every binding it started with.
    [[nodiscard]] FlattenResult flatten(const std::vector<IHierarchyNode*>& top_level,
                                        const std::string& pattern,
                                        BindingTable& previous) const;

    // Filtered walk in which nothing matches
    [[nodiscard]] FlattenResult flatten_no_match(const std::vector<IHierarchyNode*>& top_level,
                                                 BindingTable& previous) const;

    [[nodiscard]] static std::regex compile(const std::string& pattern);

    [[nodiscard]] const RowStrategy& strategy() const { return strategy_; }

private:
    using Matcher = std::function<bool(const IHierarchyNode&)>;

    [[nodiscard]] FlattenResult walk(const std::vector<IHierarchyNode*>& top_level,
                                     const Matcher& matcher,
                                     BindingTable& previous) const;

    void visit(IHierarchyNode& node, int depth, bool listed_parent,
               const Matcher& matcher, BindingTable& previous, FlattenResult& out) const;

    RowStrategy strategy_;
};

} // namespace arbor
