#include "tui_app.hpp"
#include "tui_colors.hpp"
#include <algorithm>

namespace arbor {

void TuiApp::render_sort_menu() {
    const auto& menu = view_model_.tree.sort_menu;
    if (!menu.visible) return;

    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    // Dialog dimensions
    int widest = 12;
    for (const auto& option : menu.options) {
        widest = std::max(widest, static_cast<int>(option.size()));
    }
    const int dialog_width = std::min(widest + 8, max_x);
    const int dialog_height = std::min(static_cast<int>(menu.options.size()) + 4, max_y);

    WINDOW* dialog_win = newwin(dialog_height, dialog_width,
                                std::max((max_y - dialog_height) / 2, 0),
                                std::max((max_x - dialog_width) / 2, 0));
    if (!dialog_win) return;

    wbkgd(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(dialog_win, 0, 0);

    const std::string title = " Sort by ";
    wattron(dialog_win, A_BOLD);
    mvwprintw(dialog_win, 0, std::max((dialog_width - static_cast<int>(title.size())) / 2, 1), "%s", title.c_str());
    wattroff(dialog_win, A_BOLD);

    int row = 2;
    for (int i = 0; i < static_cast<int>(menu.options.size()); ++i) {
        if (row >= dialog_height - 1) break;

        const bool highlighted = i == menu.highlighted;
        if (highlighted) {
            wattron(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_SELECTED) | A_BOLD);
            mvwhline(dialog_win, row, 1, ' ', dialog_width - 2);
        }
        mvwprintw(dialog_win, row, 3, "%s", menu.options[i].c_str());
        if (highlighted) {
            wattroff(dialog_win, COLOR_PAIR(COLOR_PAIR_DIALOG_SELECTED) | A_BOLD);
        }
        row++;
    }

    wnoutrefresh(dialog_win);
    delwin(dialog_win);
}

void TuiApp::render_help_overlay() {
    int max_y, max_x;
    getmaxyx(stdscr, max_y, max_x);

    const char* help_lines[] = {
        "Navigation:",
        "  Up/k, Down/j    Move selection up/down",
        "  Home/g, End/G   Jump to first/last",
        "  { / }           Previous/next sibling",
        "  z               Expand/collapse item",
        "  Z               Collapse to parent",
        "  Tab             Focus details panel",
        "",
        "Editing:",
        "  i               Edit item text",
        "  a               Add sibling",
        "  A               Add child",
        "  x               Remove item",
        "  K/J             Move item up/down",
        "  s               Sort siblings",
        "  Escape          Finish editing",
        "",
        "Filter:",
        "  /               Filter by regex",
        "  Enter           Keep filter, navigate matches",
        "  Escape          Clear filter",
        "",
        "  q               Quit",
        "  ?               This help",
    };
    const int line_count = static_cast<int>(std::size(help_lines));

    const int help_width = std::min(52, max_x);
    const int help_height = std::min(line_count + 4, max_y);
    WINDOW* help_win = newwin(help_height, help_width,
                              std::max((max_y - help_height) / 2, 0),
                              std::max((max_x - help_width) / 2, 0));
    if (!help_win) return;

    wbkgd(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG));
    box(help_win, 0, 0);

    // Title
    wattron(help_win, A_BOLD);
    mvwprintw(help_win, 0, (help_width - 6) / 2, " Help ");
    wattroff(help_win, A_BOLD);

    int row = 1;
    for (const char* line : help_lines) {
        if (row >= help_height - 2) break;

        const std::string text = line;
        if (text.size() > 18 && text.starts_with("  ")) {
            // Key binding line
            wattron(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 2, "%s", text.substr(2, 16).c_str());
            wattroff(help_win, COLOR_PAIR(COLOR_PAIR_HELP_KEY));
            mvwprintw(help_win, row, 18, "%s", text.substr(18).c_str());
        } else {
            wattron(help_win, A_BOLD);
            mvwprintw(help_win, row, 2, "%s", line);
            wattroff(help_win, A_BOLD);
        }
        row++;
    }

    // Close instruction
    wattron(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_SELECTED));
    mvwprintw(help_win, help_height - 2, std::max((help_width - 24) / 2, 1), " Press any key to close ");
    wattroff(help_win, COLOR_PAIR(COLOR_PAIR_DIALOG_SELECTED));

    wnoutrefresh(help_win);
    delwin(help_win);
}

void TuiApp::render_status_bar() {
    if (!status_win_) return;

    const int max_x = getmaxx(status_win_);
    const auto& tree = view_model_.tree;

    wbkgd(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS));
    werase(status_win_);

    // Left: status signal block
    const std::string block = std::string(" ") + to_string(tree.status) + " ";
    wattron(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS_MODE) | A_BOLD);
    mvwprintw(status_win_, 0, 0, "%s", block.c_str());
    wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_STATUS_MODE) | A_BOLD);

    int col = static_cast<int>(block.size()) + 1;

    // Middle: the latest notification, or key hints when there is none
    std::string message;
    bool is_error = false;
    if (view_model_.status_message) {
        message = view_model_.status_message->message;
        is_error = view_model_.status_message->level == NotificationLevel::Error;
    } else if (tree.mode == Mode::EditField) {
        message = "Escape:Save";
    } else if (tree.mode == Mode::FilterText) {
        message = "Enter:Keep  Escape:Clear";
    } else if (tree.mode == Mode::SortMenu) {
        message = "j/k:Move  Enter:Sort  Escape:Cancel";
    } else {
        message = "q:Quit  /:Filter  a/A:Add  i:Edit  z:Fold  s:Sort  Tab:Details  ?:Help";
    }

    // Right: position in the list
    std::string position;
    if (!tree.empty()) {
        position = std::to_string(tree.current + 1) + "/" + std::to_string(tree.total_rows);
    }

    const int message_width = max_x - col - static_cast<int>(position.size()) - 2;
    if (message_width > 3 && static_cast<int>(message.size()) > message_width) {
        message = message.substr(0, message_width - 3) + "...";
    }
    if (message_width > 0) {
        if (is_error) wattron(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
        mvwprintw(status_win_, 0, col, "%s", message.c_str());
        if (is_error) wattroff(status_win_, COLOR_PAIR(COLOR_PAIR_ERROR) | A_BOLD);
    }

    if (!position.empty()) {
        const int position_x = max_x - static_cast<int>(position.size()) - 1;
        if (position_x > col) {
            mvwprintw(status_win_, 0, position_x, "%s", position.c_str());
        }
    }
}

} // namespace arbor
