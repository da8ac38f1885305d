#include "tree_flattener.hpp"
#include "errors.hpp"

namespace arbor {

RowStrategy full_tree_strategy(std::vector<std::string> sort_attributes) {
    RowStrategy strategy;
    strategy.children_of = [](const IHierarchyNode& node) { return node.children(); };
    strategy.sort_attributes = std::move(sort_attributes);
    return strategy;
}

TreeFlattener::TreeFlattener(RowStrategy strategy)
    : strategy_(std::move(strategy))
{
    if (!strategy_.children_of) {
        strategy_.children_of = [](const IHierarchyNode& node) { return node.children(); };
    }
}

std::regex TreeFlattener::compile(const std::string& pattern) {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw FilterError(pattern, e.what());
    }
}

FlattenResult TreeFlattener::flatten(const std::vector<IHierarchyNode*>& top_level,
                                     const std::string& pattern,
                                     BindingTable& previous) const {
    if (pattern.empty()) {
        return walk(top_level, nullptr, previous);
    }

    const auto re = compile(pattern);
    const auto& field = strategy_.primary_field;
    return walk(top_level, [&re, &field](const IHierarchyNode& node) {
        const auto value = node.get_field(field);
        return std::regex_search(value, re);
    }, previous);
}

FlattenResult TreeFlattener::flatten_no_match(const std::vector<IHierarchyNode*>& top_level,
                                              BindingTable& previous) const {
    return walk(top_level, [](const IHierarchyNode&) { return false; }, previous);
}

FlattenResult TreeFlattener::walk(const std::vector<IHierarchyNode*>& top_level,
                                  const Matcher& matcher,
                                  BindingTable& previous) const {
    FlattenResult out;
    try {
        for (auto* node : top_level) {
            if (node) {
                visit(*node, 0, true, matcher, previous, out);
            }
        }
    } catch (...) {
        // Hand the moved bindings back so the caller's rows stay valid
        previous.merge(out.table);
        throw;
    }
    // Whatever is left in previous belongs to nodes that no longer exist
    previous.clear();
    return out;
}

void TreeFlattener::visit(IHierarchyNode& node, const int depth, const bool listed_parent,
                          const Matcher& matcher, BindingTable& previous, FlattenResult& out) const {
    const bool filtering = static_cast<bool>(matcher);
    const bool listed = filtering ? matcher(node) : listed_parent;

    RowBinding* binding = nullptr;
    if (auto it = out.table.find(node.name()); it != out.table.end()) {
        // Same identity reachable twice; keep the first binding
        binding = it->second.get();
    } else if (auto handle = previous.extract(node.name()); !handle.empty()) {
        handle.mapped()->rebind(node);
        binding = handle.mapped().get();
        out.table.insert(std::move(handle));
    } else if (listed) {
        auto fresh = std::make_unique<RowBinding>(node, depth, 0);
        binding = fresh.get();
        out.table.emplace(node.name(), std::move(fresh));
    }

    if (binding) {
        binding->depth = depth;
    }

    if (listed) {
        binding->index = static_cast<int>(out.rows.size());
        out.rows.push_back(binding);
    }

    // Unfiltered: children are listed only under an expanded, listed row.
    // They are still walked so their bindings survive.
    const bool children_listed = !filtering && listed && binding->expanded();
    for (auto* child : strategy_.children_of(node)) {
        if (child) {
            visit(*child, depth + 1, children_listed, matcher, previous, out);
        }
    }
}

} // namespace arbor
