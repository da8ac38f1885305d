#pragma once

#include <ncurses.h>
#include <string>

namespace arbor {

// Color pair indices
enum ColorPair {
    COLOR_PAIR_DEFAULT = 1,
    COLOR_PAIR_TITLE,
    COLOR_PAIR_SELECTED,
    COLOR_PAIR_EDITING,
    COLOR_PAIR_BORDER,
    COLOR_PAIR_BORDER_FOCUS,
    COLOR_PAIR_DIM,
    COLOR_PAIR_DONE,
    COLOR_PAIR_DUE,
    COLOR_PAIR_MATCH,
    COLOR_PAIR_STATUS,
    COLOR_PAIR_STATUS_MODE,
    COLOR_PAIR_ERROR,
    COLOR_PAIR_DIALOG,
    COLOR_PAIR_DIALOG_SELECTED,
    COLOR_PAIR_HELP_KEY,
    COLOR_PAIR_TREE_MARKER,
};

// Initialize ncurses color pairs
void init_colors();

// Color pair for a status field value
int get_status_color(const std::string& status);

} // namespace arbor
