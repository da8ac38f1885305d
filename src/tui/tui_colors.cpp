#include "tui_colors.hpp"

namespace arbor {

void init_colors() {
    if (!has_colors()) {
        return;
    }

    start_color();
    use_default_colors();

    init_pair(COLOR_PAIR_DEFAULT, -1, -1);  // Default terminal colors
    init_pair(COLOR_PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_SELECTED, COLOR_BLACK, COLOR_CYAN);
    init_pair(COLOR_PAIR_EDITING, COLOR_BLACK, COLOR_YELLOW);
    init_pair(COLOR_PAIR_BORDER, COLOR_WHITE, -1);
    init_pair(COLOR_PAIR_BORDER_FOCUS, COLOR_CYAN, -1);
    init_pair(COLOR_PAIR_DIM, COLOR_BLUE, -1);

    // Row content
    init_pair(COLOR_PAIR_DONE, COLOR_GREEN, -1);
    init_pair(COLOR_PAIR_DUE, COLOR_YELLOW, -1);
    init_pair(COLOR_PAIR_MATCH, COLOR_RED, -1);

    // Status
    init_pair(COLOR_PAIR_STATUS, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_STATUS_MODE, COLOR_BLACK, COLOR_GREEN);
    init_pair(COLOR_PAIR_ERROR, COLOR_RED, -1);

    // Dialog
    init_pair(COLOR_PAIR_DIALOG, COLOR_WHITE, COLOR_BLUE);
    init_pair(COLOR_PAIR_DIALOG_SELECTED, COLOR_BLACK, COLOR_WHITE);

    // Help
    init_pair(COLOR_PAIR_HELP_KEY, COLOR_CYAN, -1);

    init_pair(COLOR_PAIR_TREE_MARKER, COLOR_MAGENTA, -1);
}

int get_status_color(const std::string& status) {
    if (status == "done") {
        return COLOR_PAIR_DONE;
    }
    return COLOR_PAIR_DEFAULT;
}

} // namespace arbor
