#include "navigation_controller.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cassert>

namespace arbor {

NavigationController::NavigationController(IHierarchy* hierarchy, RowStrategy strategy, int view_height)
    : hierarchy_(hierarchy)
    , flattener_(std::move(strategy))
    , window_(0, std::max(view_height, 0))
{
    assert(hierarchy_ != nullptr);

    sort_menu_.set_options(flattener_.strategy().sort_attributes);
    build_keybindings();
    refresh_rows();
}

// ---------------------------------------------------------------------------
// Rows and selection
// ---------------------------------------------------------------------------

void NavigationController::refresh_rows() {
    const auto top_level = hierarchy_->top_level();

    FlattenResult result;
    try {
        result = flattener_.flatten(top_level, filter_.value(), table_);
    } catch (const FilterError& e) {
        spdlog::warn("filter: {}", e.what());
        notify(NotificationLevel::Error, e.what());
        result = flattener_.flatten_no_match(top_level, table_);
    }

    table_ = std::move(result.table);
    rows_ = std::move(result.rows);

    current_ = std::clamp(current_, -1, static_cast<int>(rows_.size()) - 1);
    window_.fix_view(current_);
}

void NavigationController::recover_rows() {
    try {
        refresh_rows();
    } catch (const std::exception& e) {
        // Bindings may point at nodes that are gone; none can be trusted
        spdlog::error("rows unavailable: {}", e.what());
        rows_.clear();
        table_.clear();
        current_ = -1;
        selected_name_.clear();
        rows_lost_ = true;
        window_.fix_view(current_);
        if (mode_ == Mode::EditField) {
            editing_.clear();
            mode_ = Mode::Navigate;
            set_status(Status::Normal);
        }
        return;
    }
    rows_lost_ = false;
    set_current(current_);
}

void NavigationController::set_current(int index) {
    current_ = std::clamp(index, -1, static_cast<int>(rows_.size()) - 1);
    window_.fix_view(current_);

    const std::string name = current_ >= 0 ? rows_[current_]->name() : std::string{};
    if (name == selected_name_) return;

    selected_name_ = name;
    if (current_ >= 0) {
        publish_selection();
    }
}

void NavigationController::publish_selection() {
    if (on_selection_changed_ && current_ >= 0) {
        on_selection_changed_(rows_[current_]->node());
    }
}

RowBinding* NavigationController::component() const {
    if (current_ < 0 || current_ >= static_cast<int>(rows_.size())) return nullptr;
    return rows_[current_];
}

IHierarchyNode* NavigationController::selected_node() const {
    auto* row = component();
    return row ? &row->node() : nullptr;
}

RowBinding& NavigationController::row_at(int index) const {
    if (index < 0 || index >= static_cast<int>(rows_.size())) {
        throw SelectionOutOfRange(index);
    }
    return *rows_[index];
}

int NavigationController::index_of(const std::string& name) const {
    auto it = table_.find(name);
    if (it == table_.end()) return -1;

    // Carried-over bindings keep a stale index; confirm it is listed
    const int index = it->second->index;
    if (index >= 0 && index < static_cast<int>(rows_.size()) && rows_[index] == it->second.get()) {
        return index;
    }
    return -1;
}

IHierarchyNode* NavigationController::find_node(const std::string& name) const {
    auto it = table_.find(name);
    return it != table_.end() ? &it->second->node() : nullptr;
}

void NavigationController::resize(int view_height) {
    window_.resize(std::max(view_height, 0), current_);
}

// ---------------------------------------------------------------------------
// Navigation
// ---------------------------------------------------------------------------

void NavigationController::move_up() {
    if (rows_.empty()) return;

    if (current_ < 0) {
        set_current(0);
    } else if (current_ > 0) {
        set_current(current_ - 1);
    }
}

void NavigationController::move_down() {
    set_current(current_ + 1);
}

void NavigationController::move_to_top() {
    set_current(0);
}

void NavigationController::move_to_bottom() {
    set_current(static_cast<int>(rows_.size()) - 1);
}

void NavigationController::to_next_sibling(const std::string& edit) {
    auto* node = selected_node();
    if (!node) return;

    if (auto* next = node->next_sibling()) {
        move_to_node(next->name(), edit);
    }
}

void NavigationController::to_prev_sibling(const std::string& edit) {
    auto* node = selected_node();
    if (!node) return;

    if (auto* prev = node->prev_sibling()) {
        move_to_node(prev->name(), edit);
    }
}

void NavigationController::move_to_node(const std::string& name, const std::string& edit) {
    const int index = index_of(name);
    if (index < 0) return;

    set_current(index);
    if (!edit.empty()) {
        start_edit(edit);
    }
}

// ---------------------------------------------------------------------------
// Structure
// ---------------------------------------------------------------------------

bool NavigationController::try_mutation(const char* what, const std::function<void()>& mutation) {
    try {
        mutation();
    } catch (const MutationError& e) {
        spdlog::warn("{} rejected: {}", what, e.what());
        notify(NotificationLevel::Error, e.what());
        return false;
    }
    spdlog::debug("{} applied", what);
    return true;
}

void NavigationController::shift_up() {
    auto* node = selected_node();
    if (!node) return;

    const std::string name = node->name();
    if (!try_mutation("shift up", [node] { node->shift_up(); })) return;

    refresh_rows();
    move_to_node(name);
}

void NavigationController::shift_down() {
    auto* node = selected_node();
    if (!node) return;

    const std::string name = node->name();
    if (!try_mutation("shift down", [node] { node->shift_down(); })) return;

    refresh_rows();
    move_to_node(name);
}

void NavigationController::toggle_expand() {
    toggle_expand_at(current_);
}

void NavigationController::toggle_expand_parent() {
    auto* node = selected_node();
    if (!node) return;

    int index = current_;
    if (auto* parent = node->parent()) {
        if (const int parent_index = index_of(parent->name()); parent_index >= 0) {
            index = parent_index;
        }
    }

    toggle_expand_at(index);
}

void NavigationController::toggle_expand_at(int index) {
    if (index < 0 || index >= static_cast<int>(rows_.size())) return;

    auto* row = rows_[index];
    row->toggle_expand();
    try {
        refresh_rows();
    } catch (...) {
        // The walk hands every binding back, so the row is still alive
        row->toggle_expand();
        throw;
    }
    // Rows above the toggled one do not move
    set_current(index);
}

void NavigationController::add_top_level_and_edit() {
    std::string created;
    if (!try_mutation("add top-level", [this, &created] {
            created = hierarchy_->add_top_level().name();
        })) {
        return;
    }

    refresh_rows();
    move_to_node(created, strategy().primary_field);
}

void NavigationController::add_child() {
    auto* row = component();
    if (!row) {
        add_top_level_and_edit();
        return;
    }

    std::string created;
    auto* node = &row->node();
    if (!try_mutation("add child", [node, &created] { created = node->add_child().name(); })) return;

    row->expand();
    refresh_rows();
    move_to_node(created, strategy().primary_field);
}

void NavigationController::add_sibling() {
    auto* node = selected_node();
    if (!node) {
        add_top_level_and_edit();
        return;
    }

    std::string created;
    if (!try_mutation("add sibling", [node, &created] { created = node->add_sibling().name(); })) return;

    refresh_rows();
    move_to_node(created, strategy().primary_field);
}

void NavigationController::remove_item() {
    auto* node = selected_node();
    if (!node) return;

    if (!try_mutation("drop", [node] { node->drop(); })) return;

    // The numeric index is kept; it is clamped if it now runs past the end
    refresh_rows();
    set_current(current_);
}

// ---------------------------------------------------------------------------
// Modes
// ---------------------------------------------------------------------------

void NavigationController::start_edit(const std::string& field) {
    auto* row = component();
    if (!row) return;

    auto* buffer = row->field(field);
    if (!buffer) {
        notify(NotificationLevel::Error, "no field '" + field + "' on " + row->name());
        return;
    }

    set_status(field == strategy().primary_field ? Status::Insert : Status::Date);
    buffer->focus();
    editing_ = field;
    mode_ = Mode::EditField;
}

void NavigationController::stop_edit() {
    auto* row = component();
    auto* buffer = row ? row->field(editing_) : nullptr;
    if (!buffer) {
        editing_.clear();
        mode_ = Mode::Navigate;
        set_status(Status::Normal);
        return;
    }

    auto* node = &row->node();
    const std::string field = editing_;
    const std::string value = buffer->value();
    if (!try_mutation("edit", [node, &field, &value] { node->edit_field(field, value); })) {
        // Stay in the edit so the typed text is not lost
        return;
    }

    buffer->blur();
    row->refresh_field(field);
    editing_.clear();
    mode_ = Mode::Navigate;
    set_status(Status::Normal);
}

void NavigationController::start_filtering() {
    filter_.focus();
    mode_ = Mode::FilterText;
    echo_filter();
}

void NavigationController::stop_filtering() {
    // Nothing to stop
    if (filter_.empty() && !filter_.has_focus()) return;

    filter_.clear();
    filter_.blur();
    mode_ = Mode::Navigate;
    refresh_rows();
    set_current(-1);
    echo_filter();
    set_status(Status::Normal);
}

void NavigationController::show_sort_menu() {
    sort_menu_.set_options(strategy().sort_attributes);
    sort_menu_.open();
    mode_ = Mode::SortMenu;
}

void NavigationController::sort(const std::string& attribute) {
    auto* node = selected_node();
    if (!node) return;

    const std::string name = node->name();
    if (!try_mutation("sort", [node, &attribute] { node->sort(attribute); })) return;

    refresh_rows();
    move_to_node(name);
}

void NavigationController::handle_tab() {
    if (current_ == -1) return;

    if (!filter_.empty()) {
        publish_selection();
        stop_filtering();
    }

    if (on_focus_switch_) {
        on_focus_switch_();
    }
}

// ---------------------------------------------------------------------------
// View model
// ---------------------------------------------------------------------------

TreeViewModel NavigationController::snapshot() const {
    TreeViewModel vm;
    vm.total_rows = static_cast<int>(rows_.size());
    vm.current = current_;
    vm.window_a = window_.a();
    vm.window_b = window_.b();
    vm.mode = mode_;
    vm.status = status_;
    vm.filter = filter_.value();
    vm.filter_focused = filter_.has_focus();
    vm.sort_menu.visible = sort_menu_.visible();
    vm.sort_menu.options = sort_menu_.options();
    vm.sort_menu.highlighted = sort_menu_.highlighted();

    const int first = std::max(window_.a(), 0);
    const int last = std::min(window_.b(), vm.total_rows - 1);
    for (int i = first; i <= last; ++i) {
        const RowBinding& row = *rows_[i];

        RowView view;
        view.name = row.name();
        view.index = i;
        view.depth = row.depth;
        view.expanded = row.expanded();
        view.has_children = !strategy().children_of(row.node()).empty();
        view.selected = (i == current_);
        view.editing = view.selected && mode_ == Mode::EditField;
        if (view.editing) {
            view.editing_field = editing_;
        }

        for (const auto& f : row.field_order()) {
            const auto* buffer = row.field(f);
            if (!buffer) continue;
            view.fields.emplace_back(f, view.editing && f == editing_
                                            ? buffer->render_with_cursor()
                                            : buffer->render());
        }
        vm.rows.push_back(std::move(view));
    }
    return vm;
}

// ---------------------------------------------------------------------------
// Observers
// ---------------------------------------------------------------------------

void NavigationController::set_on_selection_changed(std::function<void(IHierarchyNode&)> callback) {
    on_selection_changed_ = std::move(callback);
}

void NavigationController::set_on_notify(std::function<void(const Notification&)> callback) {
    on_notify_ = std::move(callback);
}

void NavigationController::set_on_status_changed(std::function<void(Status)> callback) {
    on_status_changed_ = std::move(callback);
}

void NavigationController::set_on_focus_switch(std::function<void()> callback) {
    on_focus_switch_ = std::move(callback);
}

void NavigationController::set_status(Status status) {
    status_ = status;
    if (on_status_changed_) {
        on_status_changed_(status);
    }
}

void NavigationController::notify(NotificationLevel level, std::string message) {
    notifications_.push(level, std::move(message));
    if (on_notify_) {
        on_notify_(notifications_.all().back());
    }
}

void NavigationController::echo_filter() {
    notify(NotificationLevel::Info, "/" + filter_.value());
}

} // namespace arbor
