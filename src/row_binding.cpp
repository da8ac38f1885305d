#include "row_binding.hpp"

namespace arbor {

RowBinding::RowBinding(IHierarchyNode& node, const int depth, const int index)
    : depth(depth)
    , index(index)
    , node_(&node)
    , name_(node.name())
{
    for (const auto& f : node.fields()) {
        field_order_.push_back(f);
        fields_.emplace(f, TextBuffer(node.get_field(f)));
    }
}

void RowBinding::rebind(IHierarchyNode& node) {
    node_ = &node;

    field_order_ = node.fields();
    for (const auto& f : field_order_) {
        auto it = fields_.find(f);
        if (it == fields_.end()) {
            fields_.emplace(f, TextBuffer(node.get_field(f)));
            continue;
        }
        if (it->second.has_focus()) continue;

        auto current = node.get_field(f);
        if (current != it->second.value()) {
            it->second.set_value(std::move(current));
        }
    }
}

void RowBinding::refresh_field(const std::string& field) {
    fields_[field] = TextBuffer(node_->get_field(field));
}

TextBuffer* RowBinding::field(const std::string& field) {
    auto it = fields_.find(field);
    return it != fields_.end() ? &it->second : nullptr;
}

const TextBuffer* RowBinding::field(const std::string& field) const {
    auto it = fields_.find(field);
    return it != fields_.end() ? &it->second : nullptr;
}

std::string RowBinding::editing_field() const {
    for (const auto& [name, buffer] : fields_) {
        if (buffer.has_focus()) return name;
    }
    return {};
}

} // namespace arbor
