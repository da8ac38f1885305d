#pragma once

#include "i_hierarchy_node.hpp"
#include <vector>

namespace arbor {

// Root collection of the hierarchy
class IHierarchy {
public:
    virtual ~IHierarchy() = default;

    [[nodiscard]] virtual std::vector<IHierarchyNode*> top_level() const = 0;

    // Appends a new top-level node and returns it. May throw MutationError.
    virtual IHierarchyNode& add_top_level() = 0;
};

} // namespace arbor
