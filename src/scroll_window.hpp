#pragma once

namespace arbor {

// Visible index range [a, b] over the flattened rows. Both ends are
// inclusive, so b - a + 1 rows are on screen and height() == b - a.
class ScrollWindow {
public:
    ScrollWindow() = default;
    ScrollWindow(int a, int b) : a_(a), b_(b) {}

    // Slide the window so that current lies in [a, b]
    void fix_view(int current);

    // Grow: only the top edge moves. Shrink: re-anchor the bottom on the
    // selection, then fix_view.
    void resize(int new_height, int current);

    void shift(int delta);
    void shift_upper(int delta) { a_ += delta; }
    void shift_lower(int delta) { b_ += delta; }

    [[nodiscard]] int a() const { return a_; }
    [[nodiscard]] int b() const { return b_; }
    [[nodiscard]] int height() const { return b_ - a_; }
    [[nodiscard]] bool contains(int index) const { return index >= a_ && index <= b_; }

private:
    int a_ = 0;
    int b_ = 0;
};

} // namespace arbor
