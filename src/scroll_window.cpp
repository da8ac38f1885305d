#include "scroll_window.hpp"
#include <algorithm>

namespace arbor {

void ScrollWindow::fix_view(int current) {
    if (a_ < 0) {
        shift(-a_);
    }

    // No selection: leave the window where it is
    if (current < 0) return;

    if (current <= a_) {
        shift(current - a_);
    }

    if (current >= b_) {
        shift(current - b_);
    }
}

void ScrollWindow::resize(int new_height, int current) {
    const int delta = height() - new_height;

    if (delta <= 0) {
        shift_upper(delta);
    } else {
        shift_lower(-delta);
        const int bottom = std::max(current + 1, b_);
        a_ = bottom - new_height;
        b_ = bottom;
    }

    fix_view(current);
}

void ScrollWindow::shift(int delta) {
    shift_lower(delta);
    shift_upper(delta);
}

} // namespace arbor
