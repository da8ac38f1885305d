#include "tui_app.hpp"

namespace arbor {

void TuiApp::handle_input(int ch) {
    if (ch == KEY_RESIZE) {
        resize_windows();
        events_.push_resize(tree_view_height());
        return;
    }

    // Help overlay takes priority; any key closes it
    if (view_model_.show_help) {
        view_model_.show_help = false;
        return;
    }

    const std::string key = translate_key(ch);
    if (key.empty()) {
        return;
    }

    // Global keys only apply while the tree is not consuming text
    const auto& tree = view_model_.tree;
    const bool navigating = tree.mode == Mode::Navigate && !tree.filter_focused;
    if (navigating && (key == "q" || key == "?")) {
        if (key == "q") {
            running_ = false;
        } else {
            view_model_.show_help = true;
            flushinp();  // Clear any pending input
        }
        return;
    }

    if (current_focus_ == PanelFocus::Details) {
        handle_details_input(key);
        return;
    }

    events_.push_key(key);
}

void TuiApp::handle_details_input(const std::string& key) {
    // The details panel is read-only; it only hands focus back
    if (key == "tab" || key == "escape") {
        current_focus_ = PanelFocus::Tree;
    }
}

std::string TuiApp::translate_key(int ch) {
    switch (ch) {
        case 27:
            return "escape";
        case KEY_UP:
            return "up";
        case KEY_DOWN:
            return "down";
        case KEY_SR:  // Shift+Up on most terminals
            return "shift+up";
        case KEY_SF:  // Shift+Down
            return "shift+down";
        case KEY_LEFT:
            return "left";
        case KEY_RIGHT:
            return "right";
        case KEY_HOME:
            return "home";
        case KEY_END:
            return "end";
        case KEY_BACKSPACE:
        case 127:
        case '\b':
            return "backspace";
        case KEY_DC:
            return "delete";
        case '\n':
        case '\r':
        case KEY_ENTER:
            return "enter";
        case '\t':
            return "tab";
        case ' ':
            return "space";
    }

    if (ch > 32 && ch < 127) {
        return std::string(1, static_cast<char>(ch));
    }
    return {};
}

} // namespace arbor
