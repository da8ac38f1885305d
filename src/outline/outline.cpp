#include "outline.hpp"
#include "../errors.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <functional>

namespace arbor::outline {

namespace {

bool is_valid_date(const std::string& value) {
    if (value.empty()) return true;
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') return false;

    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }

    const int month = std::stoi(value.substr(5, 2));
    const int day = std::stoi(value.substr(8, 2));
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

} // namespace

// ---------------------------------------------------------------------------
// OutlineNode
// ---------------------------------------------------------------------------

OutlineNode::OutlineNode(Outline& outline, OutlineNode* parent, std::string name)
    : outline_(outline)
    , parent_(parent)
    , name_(std::move(name))
{
    values_["about"] = "";
    values_["due"] = "";
    values_["status"] = "pending";
}

const std::vector<std::string>& OutlineNode::field_names() {
    static const std::vector<std::string> names = {"about", "due", "status"};
    return names;
}

std::vector<std::string> OutlineNode::fields() const {
    return field_names();
}

std::string OutlineNode::get_field(const std::string& field) const {
    if (auto it = values_.find(field); it != values_.end()) {
        return it->second;
    }
    return {};
}

void OutlineNode::edit_field(const std::string& field, const std::string& value) {
    if (!values_.contains(field)) {
        throw MutationError(std::format("{} has no field '{}'", name_, field));
    }
    if (field == "due" && !is_valid_date(value)) {
        throw MutationError(std::format("'{}' is not a date (YYYY-MM-DD)", value));
    }
    if (field == "status" && value != "pending" && value != "done") {
        throw MutationError(std::format("status must be pending or done, not '{}'", value));
    }
    values_[field] = value;
}

std::vector<IHierarchyNode*> OutlineNode::children() const {
    std::vector<IHierarchyNode*> result;
    result.reserve(children_.size());
    for (const auto& child : children_) {
        result.push_back(child.get());
    }
    return result;
}

std::vector<std::unique_ptr<OutlineNode>>& OutlineNode::siblings() const {
    return parent_ ? parent_->children_ : outline_.roots_;
}

size_t OutlineNode::position() const {
    const auto& group = siblings();
    for (size_t i = 0; i < group.size(); ++i) {
        if (group[i].get() == this) return i;
    }
    throw MutationError(std::format("{} is not attached to the outline", name_));
}

IHierarchyNode& OutlineNode::add_sibling() {
    auto& group = siblings();
    const size_t pos = position();
    auto node = std::make_unique<OutlineNode>(outline_, parent_, outline_.next_name());
    auto* raw = node.get();
    group.insert(group.begin() + static_cast<std::ptrdiff_t>(pos + 1), std::move(node));
    return *raw;
}

IHierarchyNode& OutlineNode::add_child() {
    children_.push_back(std::make_unique<OutlineNode>(outline_, this, outline_.next_name()));
    return *children_.back();
}

void OutlineNode::drop() {
    auto& group = siblings();
    const size_t pos = position();
    // Destroys this node
    group.erase(group.begin() + static_cast<std::ptrdiff_t>(pos));
}

IHierarchyNode* OutlineNode::next_sibling() const {
    const auto& group = siblings();
    const size_t pos = position();
    return pos + 1 < group.size() ? group[pos + 1].get() : nullptr;
}

IHierarchyNode* OutlineNode::prev_sibling() const {
    const auto& group = siblings();
    const size_t pos = position();
    return pos > 0 ? group[pos - 1].get() : nullptr;
}

void OutlineNode::shift_up() {
    auto& group = siblings();
    const size_t pos = position();
    if (pos == 0) return;
    std::swap(group[pos], group[pos - 1]);
}

void OutlineNode::shift_down() {
    auto& group = siblings();
    const size_t pos = position();
    if (pos + 1 >= group.size()) return;
    std::swap(group[pos], group[pos + 1]);
}

void OutlineNode::sort(const std::string& attribute) {
    if (!values_.contains(attribute)) {
        throw MutationError(std::format("cannot sort by unknown field '{}'", attribute));
    }

    // Empty values go last; ties keep their order
    std::ranges::stable_sort(siblings(), [&attribute](const auto& a, const auto& b) {
        const auto& va = a->values_.at(attribute);
        const auto& vb = b->values_.at(attribute);
        if (va.empty() != vb.empty()) return vb.empty();
        return va < vb;
    });
}

// ---------------------------------------------------------------------------
// Outline
// ---------------------------------------------------------------------------

std::vector<IHierarchyNode*> Outline::top_level() const {
    std::vector<IHierarchyNode*> result;
    result.reserve(roots_.size());
    for (const auto& root : roots_) {
        result.push_back(root.get());
    }
    return result;
}

IHierarchyNode& Outline::add_top_level() {
    roots_.push_back(std::make_unique<OutlineNode>(*this, nullptr, next_name()));
    return *roots_.back();
}

OutlineNode& Outline::add(const std::string& about, OutlineNode* parent) {
    auto& node = parent ? static_cast<OutlineNode&>(parent->add_child())
                        : static_cast<OutlineNode&>(add_top_level());
    node.values_["about"] = about;
    return node;
}

OutlineNode* Outline::find(const std::string& name) const {
    std::function<OutlineNode*(const std::vector<std::unique_ptr<OutlineNode>>&)> search;
    search = [&](const std::vector<std::unique_ptr<OutlineNode>>& nodes) -> OutlineNode* {
        for (const auto& node : nodes) {
            if (node->name_ == name) return node.get();
            if (auto* match = search(node->children_)) return match;
        }
        return nullptr;
    };
    return search(roots_);
}

size_t Outline::size() const {
    std::function<size_t(const std::vector<std::unique_ptr<OutlineNode>>&)> count;
    count = [&](const std::vector<std::unique_ptr<OutlineNode>>& nodes) {
        size_t total = nodes.size();
        for (const auto& node : nodes) {
            total += count(node->children_);
        }
        return total;
    };
    return count(roots_);
}

std::string Outline::next_name() {
    return std::format("node-{}", next_id_++);
}

std::unique_ptr<Outline> Outline::sample() {
    auto outline = std::make_unique<Outline>();

    auto& work = outline->add("work");
    auto& release = outline->add("release 2.4", &work);
    outline->add("fix bug in scroll window", &release).edit_field("due", "2026-11-02");
    outline->add("bug triage", &release);
    outline->add("write changelog", &release).edit_field("status", "done");
    auto& review = outline->add("code review", &work);
    outline->add("refactor flattener", &review);

    auto& home = outline->add("home");
    outline->add("renew passport", &home).edit_field("due", "2026-12-15");
    outline->add("groceries", &home);

    outline->add("reading list");
    return outline;
}

} // namespace arbor::outline
