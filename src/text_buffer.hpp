#pragma once

#include <string>

namespace arbor {

// Single-line editable text with a cursor. Keystrokes only apply while
// focused; the owner decides when the value is committed anywhere.
class TextBuffer {
public:
    TextBuffer() = default;
    explicit TextBuffer(std::string value);

    void focus();
    void blur();
    [[nodiscard]] bool has_focus() const { return focused_; }

    // Returns true if the key changed the value or the cursor
    bool handle_key(const std::string& key);

    void clear();
    void set_value(std::string value);

    [[nodiscard]] const std::string& value() const { return value_; }
    [[nodiscard]] size_t cursor() const { return cursor_; }
    [[nodiscard]] bool empty() const { return value_.empty(); }

    [[nodiscard]] std::string render() const { return value_; }
    [[nodiscard]] std::string render_with_cursor(char marker = '|') const;

private:
    std::string value_;
    size_t cursor_ = 0;
    bool focused_ = false;
};

} // namespace arbor
