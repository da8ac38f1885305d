#pragma once

#include <string>
#include <vector>

namespace arbor {

// One node of the external hierarchy. The core never owns nodes; it holds
// non-owning pointers for the duration of one flatten/dispatch cycle and
// re-resolves them by name() afterwards.
// Every mutation may throw MutationError.
class IHierarchyNode {
public:
    virtual ~IHierarchyNode() = default;

    // Stable, unique identity
    [[nodiscard]] virtual const std::string& name() const = 0;

    [[nodiscard]] virtual std::vector<std::string> fields() const = 0;
    [[nodiscard]] virtual std::string get_field(const std::string& field) const = 0;
    virtual void edit_field(const std::string& field, const std::string& value) = 0;

    [[nodiscard]] virtual std::vector<IHierarchyNode*> children() const = 0;

    // Lookup only; nullptr for a top-level node
    [[nodiscard]] virtual IHierarchyNode* parent() const = 0;

    // Inserts a new sibling directly after this node and returns it
    virtual IHierarchyNode& add_sibling() = 0;
    // Appends a new child and returns it
    virtual IHierarchyNode& add_child() = 0;
    // Detaches and destroys this node (and its subtree). `this` is invalid afterwards.
    virtual void drop() = 0;

    [[nodiscard]] virtual IHierarchyNode* next_sibling() const = 0;
    [[nodiscard]] virtual IHierarchyNode* prev_sibling() const = 0;

    virtual void shift_up() = 0;
    virtual void shift_down() = 0;

    // Sorts this node's sibling group by the given field
    virtual void sort(const std::string& attribute) = 0;
};

} // namespace arbor
