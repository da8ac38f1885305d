#pragma once

#include "interfaces/i_hierarchy.hpp"
#include "notification_log.hpp"
#include "row_binding.hpp"
#include "scroll_window.hpp"
#include "sort_menu.hpp"
#include "text_buffer.hpp"
#include "tree_flattener.hpp"
#include "viewmodels/tree_view_model.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor {

// Modal state machine over the flattened hierarchy.
//
// Key dispatch order: field edit, sort menu, filter input, then the
// Navigate bindings. Every hierarchy mutation is followed by a reflatten and
// a reselect; a rejected mutation leaves rows, selection and window as they
// were and is reported through the notification stream.
class NavigationController {
public:
    // Non-owning: hierarchy must outlive the controller.
    // view_height is the list area height minus chrome; the window starts
    // as [0, view_height].
    NavigationController(IHierarchy* hierarchy, RowStrategy strategy, int view_height);

    void handle_key(const std::string& key);
    void resize(int view_height);

    // Reflatten from the hierarchy. Clamps the selection without publishing it.
    void refresh_rows();

    // Selection. Clamps to [-1, rows-1], fixes the window and publishes the
    // newly selected node when the selected identity changed.
    void set_current(int index);
    [[nodiscard]] int current() const { return current_; }
    [[nodiscard]] RowBinding* component() const;
    [[nodiscard]] IHierarchyNode* selected_node() const;

    [[nodiscard]] const std::vector<RowBinding*>& rows() const { return rows_; }
    [[nodiscard]] RowBinding& row_at(int index) const;
    [[nodiscard]] int index_of(const std::string& name) const;
    // Live node that has been listed at some point, even if filtered out now
    [[nodiscard]] IHierarchyNode* find_node(const std::string& name) const;

    // Navigation
    void move_up();
    void move_down();
    void move_to_top();
    void move_to_bottom();
    void to_next_sibling(const std::string& edit = {});
    void to_prev_sibling(const std::string& edit = {});

    // Structure
    void shift_up();
    void shift_down();
    void toggle_expand();
    void toggle_expand_parent();
    void add_child();
    void add_sibling();
    void remove_item();

    // Modes
    void start_edit(const std::string& field);
    void stop_edit();
    void start_filtering();
    void stop_filtering();
    void show_sort_menu();
    void sort(const std::string& attribute);
    void handle_tab();

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] Status status() const { return status_; }
    [[nodiscard]] const std::string& editing_field() const { return editing_; }
    [[nodiscard]] const std::string& filter_pattern() const { return filter_.value(); }
    [[nodiscard]] bool filter_focused() const { return filter_.has_focus(); }
    [[nodiscard]] const ScrollWindow& window() const { return window_; }
    [[nodiscard]] const SortMenu& sort_menu() const { return sort_menu_; }
    [[nodiscard]] const NotificationLog& notifications() const { return notifications_; }
    [[nodiscard]] const RowStrategy& strategy() const { return flattener_.strategy(); }

    [[nodiscard]] TreeViewModel snapshot() const;

    // Observers
    void set_on_selection_changed(std::function<void(IHierarchyNode&)> callback);
    void set_on_notify(std::function<void(const Notification&)> callback);
    void set_on_status_changed(std::function<void(Status)> callback);
    void set_on_focus_switch(std::function<void()> callback);

private:
    void build_keybindings();

    void handle_edit_key(const std::string& key);
    void handle_sort_menu_key(const std::string& key);
    void handle_filter_key(const std::string& key);

    void move_to_node(const std::string& name, const std::string& edit = {});
    void toggle_expand_at(int index);
    // Rebuilds rows after a failed key. If the hierarchy still cannot be
    // walked, every row and binding is dropped.
    void recover_rows();
    void add_top_level_and_edit();
    void publish_selection();
    void set_status(Status status);
    void notify(NotificationLevel level, std::string message);
    void echo_filter();

    // Runs one hierarchy mutation. Returns false (after notifying) if the
    // hierarchy rejected it.
    bool try_mutation(const char* what, const std::function<void()>& mutation);

    IHierarchy* hierarchy_ = nullptr;
    TreeFlattener flattener_;
    BindingTable table_;
    std::vector<RowBinding*> rows_;

    int current_ = -1;
    std::string selected_name_;  // Identity last published to observers
    bool rows_lost_ = false;     // Set when recovery had to drop every row

    Mode mode_ = Mode::Navigate;
    Status status_ = Status::Normal;
    std::string editing_;

    TextBuffer filter_;
    SortMenu sort_menu_;
    ScrollWindow window_;
    NotificationLog notifications_;

    std::unordered_map<std::string, std::function<void()>> keybinds_;

    std::function<void(IHierarchyNode&)> on_selection_changed_;
    std::function<void(const Notification&)> on_notify_;
    std::function<void(Status)> on_status_changed_;
    std::function<void()> on_focus_switch_;
};

} // namespace arbor
