#include "navigation_controller.hpp"
#include <spdlog/spdlog.h>

namespace arbor {

void NavigationController::build_keybindings() {
    const std::string primary = strategy().primary_field;

    keybinds_ = {
        {"escape",     [this] { stop_filtering(); }},
        {"tab",        [this] { handle_tab(); }},
        {"k",          [this] { move_up(); }},
        {"up",         [this] { move_up(); }},
        {"K",          [this] { shift_up(); }},
        {"shift+up",   [this] { shift_up(); }},
        {"j",          [this] { move_down(); }},
        {"down",       [this] { move_down(); }},
        {"J",          [this] { shift_down(); }},
        {"shift+down", [this] { shift_down(); }},
        {"i",          [this, primary] { start_edit(primary); }},
        {"z",          [this] { toggle_expand(); }},
        {"Z",          [this] { toggle_expand_parent(); }},
        {"A",          [this] { add_child(); }},
        {"a",          [this] { add_sibling(); }},
        {"x",          [this] { remove_item(); }},
        {"g",          [this] { move_to_top(); }},
        {"home",       [this] { move_to_top(); }},
        {"G",          [this] { move_to_bottom(); }},
        {"end",        [this] { move_to_bottom(); }},
        {"s",          [this] { show_sort_menu(); }},
        {"/",          [this] { start_filtering(); }},
        {"{",          [this] { to_prev_sibling(); }},
        {"}",          [this] { to_next_sibling(); }},
    };
}

void NavigationController::handle_key(const std::string& key) {
    try {
        if (rows_lost_) {
            refresh_rows();
            rows_lost_ = false;
        }

        if (mode_ == Mode::EditField) {
            handle_edit_key(key);
            return;
        }

        if (mode_ == Mode::SortMenu) {
            handle_sort_menu_key(key);
            return;
        }

        if (mode_ == Mode::FilterText) {
            handle_filter_key(key);
            return;
        }

        if (auto it = keybinds_.find(key); it != keybinds_.end()) {
            it->second();
        }
    } catch (const std::exception& e) {
        // Keep the dispatch loop alive; rows are rebuilt from the hierarchy
        spdlog::error("key '{}' failed: {}", key, e.what());
        notify(NotificationLevel::Error, e.what());
        recover_rows();
    }
}

void NavigationController::handle_edit_key(const std::string& key) {
    if (key == "escape") {
        stop_edit();
        return;
    }

    auto* row = component();
    auto* buffer = row ? row->field(editing_) : nullptr;
    if (!buffer) {
        // Selection vanished under the edit
        stop_edit();
        return;
    }
    buffer->handle_key(key);
}

void NavigationController::handle_sort_menu_key(const std::string& key) {
    const auto result = sort_menu_.handle_key(key);
    if (!result.done()) return;

    mode_ = Mode::Navigate;
    if (result.state == SortMenuResult::State::Selected) {
        sort(result.attribute);
    }
}

void NavigationController::handle_filter_key(const std::string& key) {
    if (key == "escape") {
        stop_filtering();
        return;
    }

    if (key == "enter") {
        // Keep the pattern, navigate within the matches
        filter_.blur();
        mode_ = Mode::Navigate;
        echo_filter();
        return;
    }

    filter_.handle_key(key);
    echo_filter();
    refresh_rows();
    set_current(0);
}

} // namespace arbor
