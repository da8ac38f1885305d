#pragma once

#include "../interfaces/i_hierarchy.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace arbor::outline {

class Outline;

// In-memory outline entry with fields about / due / status.
// Owned by its parent's child list (or by the Outline for top level).
class OutlineNode : public IHierarchyNode {
public:
    OutlineNode(Outline& outline, OutlineNode* parent, std::string name);

    [[nodiscard]] const std::string& name() const override { return name_; }

    [[nodiscard]] std::vector<std::string> fields() const override;
    [[nodiscard]] std::string get_field(const std::string& field) const override;
    void edit_field(const std::string& field, const std::string& value) override;

    [[nodiscard]] std::vector<IHierarchyNode*> children() const override;
    [[nodiscard]] IHierarchyNode* parent() const override { return parent_; }

    IHierarchyNode& add_sibling() override;
    IHierarchyNode& add_child() override;
    void drop() override;

    [[nodiscard]] IHierarchyNode* next_sibling() const override;
    [[nodiscard]] IHierarchyNode* prev_sibling() const override;

    void shift_up() override;
    void shift_down() override;
    void sort(const std::string& attribute) override;

    [[nodiscard]] size_t child_count() const { return children_.size(); }
    [[nodiscard]] OutlineNode& child(size_t i) const { return *children_.at(i); }

    static const std::vector<std::string>& field_names();

private:
    friend class Outline;

    [[nodiscard]] std::vector<std::unique_ptr<OutlineNode>>& siblings() const;
    [[nodiscard]] size_t position() const;

    Outline& outline_;
    OutlineNode* parent_;
    std::string name_;
    std::map<std::string, std::string> values_;
    std::vector<std::unique_ptr<OutlineNode>> children_;
};

class Outline : public IHierarchy {
public:
    Outline() = default;
    Outline(const Outline&) = delete;
    Outline& operator=(const Outline&) = delete;

    [[nodiscard]] std::vector<IHierarchyNode*> top_level() const override;
    IHierarchyNode& add_top_level() override;

    // Seeding helper: new node with the given about text, appended under
    // parent (or at top level)
    OutlineNode& add(const std::string& about, OutlineNode* parent = nullptr);

    [[nodiscard]] OutlineNode* find(const std::string& name) const;
    [[nodiscard]] size_t size() const;

    // Demo content for the interactive front end
    static std::unique_ptr<Outline> sample();

private:
    friend class OutlineNode;

    std::string next_name();

    std::vector<std::unique_ptr<OutlineNode>> roots_;
    uint64_t next_id_ = 1;
};

} // namespace arbor::outline
