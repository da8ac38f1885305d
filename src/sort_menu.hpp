#pragma once

#include <string>
#include <vector>

namespace arbor {

struct SortMenuResult {
    enum class State { Pending, Selected, Cancelled };

    State state = State::Pending;
    std::string attribute;  // Set when state == Selected

    [[nodiscard]] bool done() const { return state != State::Pending; }
};

// Picker over sort attributes. Consumes every key while visible.
class SortMenu {
public:
    SortMenu() = default;
    explicit SortMenu(std::vector<std::string> options);

    void set_options(std::vector<std::string> options);
    void open();
    void close() { visible_ = false; }

    SortMenuResult handle_key(const std::string& key);

    [[nodiscard]] bool visible() const { return visible_; }
    [[nodiscard]] const std::vector<std::string>& options() const { return options_; }
    [[nodiscard]] int highlighted() const { return highlighted_; }

private:
    std::vector<std::string> options_;
    int highlighted_ = 0;
    bool visible_ = false;
};

} // namespace arbor
