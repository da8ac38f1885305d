#pragma once

#include <string>
#include <utility>
#include <vector>

namespace arbor {

enum class Mode {
    Navigate,
    EditField,
    FilterText,
    SortMenu
};

// Status-line signal
enum class Status {
    Normal,
    Insert,  // Editing the primary field
    Date     // Editing any other field
};

struct RowView {
    std::string name;
    int index = 0;
    int depth = 0;
    bool expanded = false;
    bool has_children = false;
    bool selected = false;
    bool editing = false;
    std::string editing_field;

    // Field name -> displayed text, in the node's field order. The field
    // being edited carries its cursor marker.
    std::vector<std::pair<std::string, std::string>> fields;
};

struct SortMenuView {
    bool visible = false;
    std::vector<std::string> options;
    int highlighted = 0;
};

// Everything a renderer needs for one frame
struct TreeViewModel {
    std::vector<RowView> rows;  // Only the rows inside the scroll window
    int total_rows = 0;
    int current = -1;
    int window_a = 0;
    int window_b = 0;

    Mode mode = Mode::Navigate;
    Status status = Status::Normal;

    std::string filter;
    bool filter_focused = false;

    SortMenuView sort_menu;

    [[nodiscard]] bool empty() const { return total_rows == 0; }
    [[nodiscard]] bool has_more_above() const { return window_a > 0; }
    [[nodiscard]] bool has_more_below() const { return window_b < total_rows - 1; }
};

[[nodiscard]] inline const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::Navigate: return "NAVIGATE";
        case Mode::EditField: return "EDIT";
        case Mode::FilterText: return "FILTER";
        case Mode::SortMenu: return "SORT";
    }
    return "";
}

[[nodiscard]] inline const char* to_string(Status status) {
    switch (status) {
        case Status::Normal: return "NORMAL";
        case Status::Insert: return "INSERT";
        case Status::Date: return "DATE";
    }
    return "";
}

} // namespace arbor
