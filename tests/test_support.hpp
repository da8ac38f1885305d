#pragma once

#include "errors.hpp"
#include "interfaces/i_hierarchy.hpp"
#include "navigation_controller.hpp"
#include "notification_log.hpp"
#include <algorithm>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

namespace arbor::test {

// Primary field of every row, in flattened order
inline std::vector<std::string> abouts(const std::vector<RowBinding*>& rows) {
    std::vector<std::string> out;
    for (const auto* row : rows) {
        out.push_back(row->node().get_field("about"));
    }
    return out;
}

inline std::vector<std::string> abouts(const NavigationController& nav) {
    return abouts(nav.rows());
}

inline std::string selected_about(const NavigationController& nav) {
    auto* node = nav.selected_node();
    return node ? node->get_field("about") : std::string{};
}

inline int count_errors(const NotificationLog& log) {
    return static_cast<int>(std::count_if(log.all().begin(), log.all().end(), [](const Notification& n) {
        return n.level == NotificationLevel::Error;
    }));
}

inline void type(NavigationController& nav, const std::string& text) {
    for (char c : text) {
        nav.handle_key(c == ' ' ? std::string("space") : std::string(1, c));
    }
}

inline void press(NavigationController& nav, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        nav.handle_key(key);
    }
}

// ---------------------------------------------------------------------------
// Single-field hierarchy that can be told to reject every mutation
// ---------------------------------------------------------------------------

class FakeHierarchy;

class FakeNode : public IHierarchyNode {
public:
    FakeNode(FakeHierarchy& owner, FakeNode* parent, std::string name, std::string about)
        : owner_(owner), parent_(parent), name_(std::move(name)), about_(std::move(about)) {}

    const std::string& name() const override { return name_; }
    std::vector<std::string> fields() const override { return {"about"}; }
    std::string get_field(const std::string& field) const override {
        return field == "about" ? about_ : std::string{};
    }

    void edit_field(const std::string& field, const std::string& value) override;

    std::vector<IHierarchyNode*> children() const override {
        std::vector<IHierarchyNode*> out;
        for (const auto& child : children_) out.push_back(child.get());
        return out;
    }
    IHierarchyNode* parent() const override { return parent_; }

    IHierarchyNode& add_sibling() override;
    IHierarchyNode& add_child() override;
    void drop() override;

    IHierarchyNode* next_sibling() const override;
    IHierarchyNode* prev_sibling() const override;

    void shift_up() override;
    void shift_down() override;
    void sort(const std::string& attribute) override;

    std::vector<std::unique_ptr<FakeNode>> children_;

private:
    std::vector<std::unique_ptr<FakeNode>>& group() const;
    size_t position() const;

    FakeHierarchy& owner_;
    FakeNode* parent_;
    std::string name_;
    std::string about_;
};

class FakeHierarchy : public IHierarchy {
public:
    std::vector<IHierarchyNode*> top_level() const override {
        std::vector<IHierarchyNode*> out;
        for (const auto& root : roots_) out.push_back(root.get());
        return out;
    }

    IHierarchyNode& add_top_level() override {
        check();
        return add("");
    }

    // Seeding; ignores reject
    FakeNode& add(const std::string& about, FakeNode* parent = nullptr) {
        auto& group = parent ? parent->children_ : roots_;
        group.push_back(std::make_unique<FakeNode>(*this, parent, next_name(), about));
        return *group.back();
    }

    void check() const {
        if (reject) throw MutationError("hierarchy is read-only");
    }

    std::string next_name() { return "fake-" + std::to_string(next_id_++); }

    bool reject = false;
    std::vector<std::unique_ptr<FakeNode>> roots_;

private:
    int next_id_ = 1;
};

inline std::vector<std::unique_ptr<FakeNode>>& FakeNode::group() const {
    return parent_ ? parent_->children_ : owner_.roots_;
}

inline size_t FakeNode::position() const {
    auto& g = group();
    for (size_t i = 0; i < g.size(); ++i) {
        if (g[i].get() == this) return i;
    }
    throw MutationError(name_ + " is detached");
}

inline void FakeNode::edit_field(const std::string& field, const std::string& value) {
    owner_.check();
    if (field != "about") throw MutationError("no field " + field);
    about_ = value;
}

inline IHierarchyNode& FakeNode::add_sibling() {
    owner_.check();
    auto& g = group();
    const size_t pos = position();
    auto node = std::make_unique<FakeNode>(owner_, parent_, owner_.next_name(), "");
    auto* raw = node.get();
    g.insert(g.begin() + static_cast<std::ptrdiff_t>(pos + 1), std::move(node));
    return *raw;
}

inline IHierarchyNode& FakeNode::add_child() {
    owner_.check();
    children_.push_back(std::make_unique<FakeNode>(owner_, this, owner_.next_name(), ""));
    return *children_.back();
}

inline void FakeNode::drop() {
    owner_.check();
    auto& g = group();
    g.erase(g.begin() + static_cast<std::ptrdiff_t>(position()));
}

inline IHierarchyNode* FakeNode::next_sibling() const {
    auto& g = group();
    const size_t pos = position();
    return pos + 1 < g.size() ? g[pos + 1].get() : nullptr;
}

inline IHierarchyNode* FakeNode::prev_sibling() const {
    auto& g = group();
    const size_t pos = position();
    return pos > 0 ? g[pos - 1].get() : nullptr;
}

inline void FakeNode::shift_up() {
    owner_.check();
    auto& g = group();
    const size_t pos = position();
    if (pos > 0) std::swap(g[pos], g[pos - 1]);
}

inline void FakeNode::shift_down() {
    owner_.check();
    auto& g = group();
    const size_t pos = position();
    if (pos + 1 < g.size()) std::swap(g[pos], g[pos + 1]);
}

inline void FakeNode::sort(const std::string& attribute) {
    owner_.check();
    if (attribute != "about") throw MutationError("cannot sort by " + attribute);
    std::ranges::stable_sort(group(), [](const auto& a, const auto& b) { return a->about_ < b->about_; });
}

} // namespace arbor::test
