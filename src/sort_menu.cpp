#include "sort_menu.hpp"
#include <algorithm>

namespace arbor {

SortMenu::SortMenu(std::vector<std::string> options)
    : options_(std::move(options))
{
}

void SortMenu::set_options(std::vector<std::string> options) {
    options_ = std::move(options);
    highlighted_ = 0;
}

void SortMenu::open() {
    highlighted_ = 0;
    visible_ = true;
}

SortMenuResult SortMenu::handle_key(const std::string& key) {
    if (!visible_) return {SortMenuResult::State::Cancelled, {}};

    const int last = static_cast<int>(options_.size()) - 1;

    if (key == "j" || key == "down") {
        highlighted_ = std::min(highlighted_ + 1, std::max(last, 0));
    } else if (key == "k" || key == "up") {
        highlighted_ = std::max(highlighted_ - 1, 0);
    } else if (key == "enter") {
        visible_ = false;
        if (options_.empty()) {
            return {SortMenuResult::State::Cancelled, {}};
        }
        return {SortMenuResult::State::Selected, options_[highlighted_]};
    } else if (key == "escape" || key == "q") {
        visible_ = false;
        return {SortMenuResult::State::Cancelled, {}};
    }

    return {};
}

} // namespace arbor
