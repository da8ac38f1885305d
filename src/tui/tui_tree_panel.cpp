#include "tui_app.hpp"
#include "tui_colors.hpp"
#include "../errors.hpp"
#include "../tree_flattener.hpp"
#include <algorithm>
#include <optional>

namespace arbor {

void TuiApp::render_tree_panel() {
    if (!tree_win_) return;

    int max_y, max_x;
    getmaxyx(tree_win_, max_y, max_x);

    const auto& tree = view_model_.tree;

    // Filter goes in the title so every inner line is a list row
    std::string title = "Outline";
    if (!tree.filter.empty() || tree.filter_focused) {
        title += " /" + tree.filter;
        if (tree.filter_focused) title += "_";
    }
    draw_box_title(tree_win_, title, current_focus_ == PanelFocus::Tree);

    if (tree.empty()) {
        render_empty_placeholder(max_y, max_x);
        return;
    }

    // Highlight matches; a pattern that does not compile has no rows anyway
    std::optional<std::regex> highlight;
    if (!tree.filter.empty()) {
        try {
            highlight = TreeFlattener::compile(tree.filter);
        } catch (const FilterError&) {
            highlight.reset();
        }
    }

    int y = 1;
    for (const auto& row : tree.rows) {
        if (y >= max_y - 1) break;
        draw_row(row, y, max_x - 2, highlight ? &*highlight : nullptr);
        y++;
    }

    // Scroll indicators
    if (tree.has_more_above()) {
        wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(tree_win_, 0, max_x - 5, "^^^");
        wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
    if (tree.has_more_below()) {
        wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
        mvwprintw(tree_win_, max_y - 1, max_x - 5, "vvv");
        wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_TITLE));
    }
}

void TuiApp::render_empty_placeholder(int max_y, int max_x) {
    const bool filtering = !view_model_.tree.filter.empty();
    const std::string line1 = filtering ? "No matches" : "Nothing here yet";
    const std::string line2 = filtering ? "escape clears the filter" : "press 'a' to add an item";

    const int y = std::max(1, max_y / 2 - 1);
    wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_BOLD);
    mvwprintw(tree_win_, y, std::max(1, (max_x - static_cast<int>(line1.size())) / 2), "%s", line1.c_str());
    wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM) | A_BOLD);

    wattron(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM));
    mvwprintw(tree_win_, y + 1, std::max(1, (max_x - static_cast<int>(line2.size())) / 2), "%s", line2.c_str());
    wattroff(tree_win_, COLOR_PAIR(COLOR_PAIR_DIM));
}

void TuiApp::draw_row(const RowView& row, int y, int width, const std::regex* highlight) {
    const std::string& primary = strategy_.primary_field;
    const bool filtering = !view_model_.tree.filter.empty();

    // Status decides the base color for the whole row
    std::string status;
    for (const auto& [field, text] : row.fields) {
        if (field == "status") status = text;
    }

    int base_attr = COLOR_PAIR(get_status_color(status));
    if (row.editing) {
        base_attr = COLOR_PAIR(COLOR_PAIR_EDITING);
    } else if (row.selected) {
        base_attr = COLOR_PAIR(COLOR_PAIR_SELECTED);
    }

    if (row.selected || row.editing) {
        wattron(tree_win_, base_attr);
        mvwhline(tree_win_, y, 1, ' ', width);
        wattroff(tree_win_, base_attr);
    }

    int col = 1;
    const int right = 1 + width;

    // Matches are listed flat, so depth only indents the unfiltered tree
    if (!filtering) {
        col += std::min(2 * row.depth, std::max(width - 4, 0));
    }

    // Expand/collapse marker
    const int marker_attr = (row.selected || row.editing) ? base_attr | A_BOLD
                                                          : COLOR_PAIR(COLOR_PAIR_TREE_MARKER) | A_BOLD;
    wattron(tree_win_, marker_attr);
    if (row.has_children) {
        mvwaddch(tree_win_, y, col, row.expanded ? '-' : '+');
    } else {
        mvwaddch(tree_win_, y, col, ' ');
    }
    wattroff(tree_win_, marker_attr);
    col += 2;

    // Primary field, with the filter matches picked out
    for (const auto& [field, text] : row.fields) {
        if (field != primary) continue;
        const int attr = status == "done" ? base_attr | A_DIM : base_attr;
        col = draw_highlighted(tree_win_, y, col, text, right - col, attr, highlight);
    }

    // Remaining fields follow as short tags
    for (const auto& [field, text] : row.fields) {
        if (field == primary || col >= right - 1) continue;

        const bool editing_this = row.editing && field == row.editing_field;
        if (text.empty() && !editing_this) continue;
        if (field == "status" && text == "pending" && !editing_this) continue;

        int attr = base_attr;
        if (!row.selected && !row.editing) {
            attr = field == "due" ? COLOR_PAIR(COLOR_PAIR_DUE) : COLOR_PAIR(COLOR_PAIR_DIM);
        }
        if (editing_this) {
            attr = COLOR_PAIR(COLOR_PAIR_EDITING) | A_BOLD;
        }

        const std::string tag = editing_this ? field + ": " + text : text;
        col += 2;
        col = draw_highlighted(tree_win_, y, col, "[" + tag + "]", right - col, attr, nullptr);
    }
}

int TuiApp::draw_highlighted(WINDOW* win, int y, int x, const std::string& text, int width,
                             int base_attr, const std::regex* highlight) {
    if (width <= 0) return x;

    std::string clipped = text;
    if (static_cast<int>(clipped.size()) > width) {
        clipped = width > 3 ? clipped.substr(0, width - 3) + "..." : clipped.substr(0, width);
    }

    if (!highlight) {
        wattron(win, base_attr);
        mvwprintw(win, y, x, "%s", clipped.c_str());
        wattroff(win, base_attr);
        return x + static_cast<int>(clipped.size());
    }

    // Walk the matches, alternating plain and highlighted runs
    size_t pos = 0;
    int col = x;
    auto put = [&](size_t from, size_t to, int attr) {
        if (to <= from) return;
        const std::string run = clipped.substr(from, to - from);
        wattron(win, attr);
        mvwprintw(win, y, col, "%s", run.c_str());
        wattroff(win, attr);
        col += static_cast<int>(run.size());
    };

    for (auto it = std::sregex_iterator(clipped.begin(), clipped.end(), *highlight);
         it != std::sregex_iterator(); ++it) {
        const size_t start = static_cast<size_t>(it->position());
        const size_t end = start + static_cast<size_t>(it->length());
        if (end == start) continue;  // Empty match
        put(pos, start, base_attr);
        put(start, end, COLOR_PAIR(COLOR_PAIR_MATCH) | A_BOLD);
        pos = end;
    }
    put(pos, clipped.size(), base_attr);
    return col;
}

} // namespace arbor
