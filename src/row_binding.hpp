#pragma once

#include "interfaces/i_hierarchy_node.hpp"
#include "text_buffer.hpp"
#include <map>
#include <string>
#include <vector>

namespace arbor {

// Per-row UI state for one hierarchy node. The buffers are the only staging
// area for in-progress edits; the node itself changes on commit only.
class RowBinding {
public:
    RowBinding(IHierarchyNode& node, int depth, int index);

    [[nodiscard]] IHierarchyNode& node() const { return *node_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    // Point at the live node again after a rebuild and pick up fields that
    // appeared or changed. A focused buffer is left untouched.
    void rebind(IHierarchyNode& node);

    // Re-seed one buffer from the node's current value
    void refresh_field(const std::string& field);

    [[nodiscard]] TextBuffer* field(const std::string& field);
    [[nodiscard]] const TextBuffer* field(const std::string& field) const;
    [[nodiscard]] const std::vector<std::string>& field_order() const { return field_order_; }

    // The field whose buffer has focus, or empty when no edit is in progress
    [[nodiscard]] std::string editing_field() const;

    void toggle_expand() { expanded_ = !expanded_; }
    void expand(bool expand = true) { expanded_ = expand; }
    [[nodiscard]] bool expanded() const { return expanded_; }

    int depth = 0;
    int index = 0;

private:
    IHierarchyNode* node_;
    std::string name_;
    bool expanded_ = false;
    std::vector<std::string> field_order_;
    std::map<std::string, TextBuffer> fields_;
};

} // namespace arbor
