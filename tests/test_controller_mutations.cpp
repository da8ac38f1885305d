#include "navigation_controller.hpp"
#include "outline/outline.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace arbor;
using arbor::outline::Outline;
using arbor::outline::OutlineNode;
using namespace arbor::test;

namespace {

class MutationTest : public ::testing::Test {
protected:
    MutationTest() {
        p1 = &outline.add("P1");
        outline.add("C1", p1);
        outline.add("P2");
    }

    void start(RowStrategy strategy = full_tree_strategy(OutlineNode::field_names())) {
        nav = std::make_unique<NavigationController>(&outline, std::move(strategy), 10);
        nav->set_on_selection_changed([this](IHierarchyNode& node) {
            published.push_back(node.get_field("about"));
        });
        nav->set_on_focus_switch([this] { focus_switches++; });
    }

    Outline outline;
    OutlineNode* p1 = nullptr;
    std::unique_ptr<NavigationController> nav;
    std::vector<std::string> published;
    int focus_switches = 0;
};

} // namespace

// ---------------------------------------------------------------------------
// Adding and removing
// ---------------------------------------------------------------------------

TEST_F(MutationTest, AddSiblingInsertsAfterAndEdits) {
    start();
    press(*nav, {"j", "a"});

    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "", "P2"}));
    EXPECT_EQ(nav->current(), 1);
    EXPECT_EQ(nav->mode(), Mode::EditField);
    EXPECT_EQ(nav->editing_field(), "about");
    EXPECT_EQ(nav->status(), Status::Insert);

    type(*nav, "middle");
    nav->handle_key("escape");
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "middle", "P2"}));
}

TEST_F(MutationTest, AddChildExpandsAndEdits) {
    start();
    press(*nav, {"G", "A"});

    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "P2", ""}));
    EXPECT_EQ(nav->current(), 2);
    EXPECT_EQ(nav->component()->depth, 1);
    EXPECT_TRUE(nav->row_at(1).expanded());
    EXPECT_EQ(nav->mode(), Mode::EditField);
}

TEST_F(MutationTest, AddWithoutSelectionCreatesTopLevel) {
    start();
    nav->handle_key("a");
    EXPECT_EQ(outline.top_level().size(), 3u);
    EXPECT_EQ(nav->current(), 2);
    EXPECT_EQ(nav->mode(), Mode::EditField);

    nav->handle_key("escape");
    nav->set_current(-1);
    nav->handle_key("A");
    EXPECT_EQ(outline.top_level().size(), 4u);
}

TEST_F(MutationTest, ExpansionSurvivesUnrelatedMutation) {
    start();
    press(*nav, {"j", "z", "G", "a", "escape"});

    EXPECT_TRUE(nav->row_at(0).expanded());
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "C1", "P2", ""}));
}

TEST_F(MutationTest, ScenarioE_DropLastRowClamps) {
    start();
    nav->handle_key("G");
    ASSERT_EQ(nav->current(), 1);

    nav->handle_key("x");
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1"}));
    EXPECT_EQ(nav->current(), 0);
}

TEST_F(MutationTest, DropKeepsNumericIndex) {
    outline.add("P3");
    start();
    press(*nav, {"j", "j"});
    ASSERT_EQ(selected_about(*nav), "P2");

    nav->handle_key("x");
    EXPECT_EQ(nav->current(), 1);
    EXPECT_EQ(selected_about(*nav), "P3");
    EXPECT_EQ(published.back(), "P3");
}

TEST_F(MutationTest, DropRemovesSubtreeRows) {
    start();
    press(*nav, {"j", "z", "x"});
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P2"}));
    EXPECT_EQ(nav->current(), 0);
}

TEST_F(MutationTest, FindNodeSeesFilteredButNotDropped) {
    start();
    const std::string p1_name = p1->name();
    nav->handle_key("/");
    type(*nav, "P2");
    nav->handle_key("enter");
    ASSERT_EQ(abouts(*nav), (std::vector<std::string>{"P2"}));
    EXPECT_EQ(nav->find_node(p1_name), p1);

    press(*nav, {"escape", "g"});
    ASSERT_EQ(selected_about(*nav), "P1");
    nav->handle_key("x");
    EXPECT_EQ(nav->find_node(p1_name), nullptr);
    EXPECT_EQ(nav->find_node("no-such-node"), nullptr);
}

TEST_F(MutationTest, DropOnlyRowLeavesNoSelection) {
    Outline single;
    single.add("alone");
    NavigationController lone(&single, full_tree_strategy({"about"}), 5);
    press(lone, {"j", "x"});
    EXPECT_TRUE(lone.rows().empty());
    EXPECT_EQ(lone.current(), -1);
}

// ---------------------------------------------------------------------------
// Reordering and sorting
// ---------------------------------------------------------------------------

TEST_F(MutationTest, ShiftFollowsTheNode) {
    start();
    press(*nav, {"G", "K"});
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P2", "P1"}));
    EXPECT_EQ(nav->current(), 0);
    EXPECT_EQ(selected_about(*nav), "P2");

    nav->handle_key("shift+down");
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "P2"}));
    EXPECT_EQ(selected_about(*nav), "P2");
}

TEST_F(MutationTest, ShiftAtBoundaryChangesNothing) {
    start();
    press(*nav, {"j", "K"});
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "P2"}));
    EXPECT_EQ(nav->current(), 0);
}

TEST_F(MutationTest, SortReselectsByIdentity) {
    Outline letters;
    letters.add("c");
    letters.add("a");
    letters.add("b");
    NavigationController sorter(&letters, full_tree_strategy(OutlineNode::field_names()), 5);

    press(sorter, {"j", "s"});
    EXPECT_EQ(sorter.mode(), Mode::SortMenu);
    EXPECT_TRUE(sorter.sort_menu().visible());

    sorter.handle_key("enter");
    EXPECT_EQ(sorter.mode(), Mode::Navigate);
    EXPECT_EQ(abouts(sorter), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(sorter.current(), 2);
    EXPECT_EQ(selected_about(sorter), "c");
}

TEST_F(MutationTest, SortMenuPicksAttribute) {
    outline.find(p1->name())->edit_field("due", "2026-12-24");
    outline.add("P3").edit_field("due", "2026-11-01");
    start();

    press(*nav, {"j", "s", "j", "enter"});
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P3", "P1", "P2"}));
    EXPECT_EQ(selected_about(*nav), "P1");
}

TEST_F(MutationTest, SortMenuCancelAndConsumesKeys) {
    start();
    press(*nav, {"j", "s", "x", "z"});
    EXPECT_EQ(nav->mode(), Mode::SortMenu);
    EXPECT_EQ(outline.top_level().size(), 2u);

    nav->handle_key("escape");
    EXPECT_EQ(nav->mode(), Mode::Navigate);
    EXPECT_FALSE(nav->sort_menu().visible());
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "P2"}));
}

TEST_F(MutationTest, RejectedSortIsReported) {
    start(full_tree_strategy({"priority"}));
    press(*nav, {"G", "s", "enter"});

    EXPECT_EQ(count_errors(nav->notifications()), 1);
    EXPECT_EQ(abouts(*nav), (std::vector<std::string>{"P1", "P2"}));
    EXPECT_EQ(nav->current(), 1);
    EXPECT_EQ(nav->mode(), Mode::Navigate);
}

// ---------------------------------------------------------------------------
// Hierarchy errors
// ---------------------------------------------------------------------------

TEST(ControllerErrors, RejectedMutationsLeaveStateUnchanged) {
    FakeHierarchy tree;
    auto& a = tree.add("a");
    tree.add("child", &a);
    tree.add("b");
    NavigationController nav(&tree, full_tree_strategy({"about"}), 5);
    press(nav, {"j", "j"});
    const auto rows = nav.rows();

    tree.reject = true;
    press(nav, {"A", "a", "x", "K", "J"});

    EXPECT_EQ(nav.rows(), rows);
    EXPECT_EQ(nav.current(), 1);
    EXPECT_EQ(selected_about(nav), "b");
    EXPECT_EQ(nav.mode(), Mode::Navigate);
    EXPECT_EQ(count_errors(nav.notifications()), 5);
}

TEST(ControllerErrors, RejectedAddChildDoesNotExpand) {
    FakeHierarchy tree;
    auto& a = tree.add("a");
    tree.add("child", &a);
    NavigationController nav(&tree, full_tree_strategy({"about"}), 5);
    nav.handle_key("j");

    tree.reject = true;
    nav.handle_key("A");
    EXPECT_FALSE(nav.row_at(0).expanded());
    EXPECT_EQ(abouts(nav), (std::vector<std::string>{"a"}));
}

TEST(ControllerErrors, RejectedTopLevelAdd) {
    FakeHierarchy tree;
    tree.reject = true;
    NavigationController nav(&tree, full_tree_strategy({"about"}), 5);

    nav.handle_key("a");
    EXPECT_TRUE(nav.rows().empty());
    EXPECT_EQ(nav.mode(), Mode::Navigate);
    EXPECT_EQ(count_errors(nav.notifications()), 1);
}

TEST(ControllerErrors, RejectedEditKeepsTypedText) {
    FakeHierarchy tree;
    tree.add("draft");
    NavigationController nav(&tree, full_tree_strategy({"about"}), 5);
    press(nav, {"j", "i"});
    type(nav, " v2");

    tree.reject = true;
    nav.handle_key("escape");
    EXPECT_EQ(nav.mode(), Mode::EditField);
    EXPECT_EQ(nav.component()->field("about")->value(), "draft v2");

    tree.reject = false;
    nav.handle_key("escape");
    EXPECT_EQ(nav.mode(), Mode::Navigate);
    EXPECT_EQ(tree.roots_.front()->get_field("about"), "draft v2");
}

TEST(ControllerErrors, UnexpectedErrorsStopAtKeyDispatch) {
    Outline outline;
    auto& parent = outline.add("parent");
    outline.add("child", &parent);

    bool armed = false;
    RowStrategy strategy = full_tree_strategy({"about"});
    strategy.children_of = [&armed](const IHierarchyNode& node) {
        if (armed) {
            armed = false;
            throw std::runtime_error("hierarchy unavailable");
        }
        return node.children();
    };
    NavigationController nav(&outline, strategy, 5);
    nav.handle_key("j");

    armed = true;
    EXPECT_NO_THROW(nav.handle_key("z"));
    EXPECT_EQ(count_errors(nav.notifications()), 1);
    EXPECT_EQ(abouts(nav), (std::vector<std::string>{"parent"}));
    EXPECT_FALSE(nav.row_at(0).expanded());
    EXPECT_EQ(nav.current(), 0);
}

namespace {

// children_of that fails for as long as the flag is set
RowStrategy failing_strategy(const bool& broken) {
    RowStrategy strategy = full_tree_strategy({"about"});
    strategy.children_of = [&broken](const IHierarchyNode& node) {
        if (broken) throw std::runtime_error("hierarchy unavailable");
        return node.children();
    };
    return strategy;
}

} // namespace

TEST(ControllerErrors, ExpandWithBrokenHierarchyKeepsDispatching) {
    Outline outline;
    auto& parent = outline.add("parent");
    outline.add("child", &parent);

    bool broken = false;
    NavigationController nav(&outline, failing_strategy(broken), 5);
    nav.handle_key("j");

    broken = true;
    EXPECT_NO_THROW(nav.handle_key("z"));
    EXPECT_TRUE(nav.rows().empty());
    EXPECT_EQ(nav.current(), -1);
    EXPECT_EQ(nav.selected_node(), nullptr);
    EXPECT_EQ(count_errors(nav.notifications()), 1);

    EXPECT_NO_THROW(nav.handle_key("z"));
    EXPECT_TRUE(nav.rows().empty());

    // The next key after the hierarchy heals brings the rows back
    broken = false;
    nav.handle_key("j");
    EXPECT_EQ(abouts(nav), (std::vector<std::string>{"parent"}));
    EXPECT_EQ(selected_about(nav), "parent");
}

TEST(ControllerErrors, DropWithBrokenHierarchyLeavesNoStaleRows) {
    FakeHierarchy tree;
    tree.add("first");
    tree.add("second");

    bool broken = false;
    NavigationController nav(&tree, failing_strategy(broken), 5);
    nav.handle_key("j");
    ASSERT_EQ(selected_about(nav), "first");

    broken = true;
    EXPECT_NO_THROW(nav.handle_key("x"));
    EXPECT_EQ(tree.roots_.size(), 1u);
    EXPECT_TRUE(nav.rows().empty());
    EXPECT_EQ(nav.selected_node(), nullptr);
    EXPECT_TRUE(nav.snapshot().empty());

    broken = false;
    nav.handle_key("g");
    EXPECT_EQ(abouts(nav), (std::vector<std::string>{"second"}));
    EXPECT_EQ(selected_about(nav), "second");
}

TEST(ControllerErrors, RecoveredRowsPublishTheNewSelection) {
    FakeHierarchy tree;
    tree.add("first");
    tree.add("second");

    bool armed = false;
    RowStrategy strategy = full_tree_strategy({"about"});
    strategy.children_of = [&armed](const IHierarchyNode& node) {
        if (armed) {
            armed = false;
            throw std::runtime_error("hierarchy unavailable");
        }
        return node.children();
    };
    NavigationController nav(&tree, strategy, 5);
    std::vector<std::string> published;
    nav.set_on_selection_changed([&published](IHierarchyNode& node) {
        published.push_back(node.get_field("about"));
    });
    nav.handle_key("j");

    armed = true;
    EXPECT_NO_THROW(nav.handle_key("x"));
    EXPECT_EQ(abouts(nav), (std::vector<std::string>{"second"}));
    EXPECT_EQ(nav.current(), 0);
    EXPECT_EQ(published, (std::vector<std::string>{"first", "second"}));
}

// ---------------------------------------------------------------------------
// Focus hand-off
// ---------------------------------------------------------------------------

TEST_F(MutationTest, TabWithoutSelectionDoesNothing) {
    start();
    nav->handle_key("tab");
    EXPECT_EQ(focus_switches, 0);
}

TEST_F(MutationTest, TabHandsFocusOver) {
    start();
    nav->handle_key("j");
    nav->handle_key("tab");
    EXPECT_EQ(focus_switches, 1);
    EXPECT_EQ(nav->current(), 0);
}

TEST_F(MutationTest, TabWithFilterPublishesAndClears) {
    start();
    press(*nav, {"/", "2", "enter"});
    const auto seen = published.size();

    nav->handle_key("tab");
    EXPECT_EQ(published.size(), seen + 1);
    EXPECT_EQ(published.back(), "P2");
    EXPECT_TRUE(nav->filter_pattern().empty());
    EXPECT_EQ(nav->current(), -1);
    EXPECT_EQ(focus_switches, 1);
}
