#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace arbor {

void TuiApp::render_details_panel() {
    if (!details_win_) return;

    int max_y, max_x;
    getmaxyx(details_win_, max_y, max_x);

    draw_box_title(details_win_, "Details", current_focus_ == PanelFocus::Details);

    const auto& details = view_model_.details;
    if (details.node_name.empty()) {
        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
        mvwprintw(details_win_, 1, 2, "(nothing selected)");
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
        return;
    }

    const int text_width = std::max(max_x - 4, 1);
    auto clip = [text_width](std::string text) {
        if (static_cast<int>(text.size()) > text_width) {
            text = text_width > 3 ? text.substr(0, text_width - 3) + "..." : text.substr(0, text_width);
        }
        return text;
    };

    int row = 1;

    // Breadcrumb of ancestors
    wattron(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
    mvwprintw(details_win_, row++, 2, "%s", clip(details.path.empty() ? "(top level)" : details.path).c_str());
    wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));

    if (row < max_y - 1) {
        mvwhline(details_win_, row++, 1, ACS_HLINE, max_x - 2);
    }

    // Field table
    int label_width = 0;
    for (const auto& [field, value] : details.fields) {
        label_width = std::max(label_width, static_cast<int>(field.size()));
    }

    for (const auto& [field, value] : details.fields) {
        if (row >= max_y - 1) break;

        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);
        mvwprintw(details_win_, row, 2, "%-*s", label_width, field.c_str());
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_HELP_KEY) | A_BOLD);

        int color = COLOR_PAIR_DEFAULT;
        if (field == "status") {
            color = get_status_color(value);
        } else if (field == "due" && !value.empty()) {
            color = COLOR_PAIR_DUE;
        }

        const int value_x = 2 + label_width + 2;
        const std::string shown = value.empty() ? "-" : value;
        wattron(details_win_, COLOR_PAIR(color));
        mvwprintw(details_win_, row, value_x, "%s",
                  shown.substr(0, static_cast<size_t>(std::max(max_x - value_x - 1, 0))).c_str());
        wattroff(details_win_, COLOR_PAIR(color));
        row++;
    }

    if (row < max_y - 1) {
        row++;
    }
    if (row < max_y - 1) {
        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
        mvwprintw(details_win_, row++, 2, "%d %s", details.child_count,
                  details.child_count == 1 ? "child" : "children");
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
    }

    // Footer: identity and selection counter
    if (max_y > 3) {
        wattron(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
        mvwprintw(details_win_, max_y - 2, 2, "%s", clip(details.node_name + "  #" + std::to_string(details.selections_seen)).c_str());
        wattroff(details_win_, COLOR_PAIR(COLOR_PAIR_DIM));
    }
}

} // namespace arbor
